#include "emmc/data_sink.hpp"
#include "emmc/error.hpp"
#include "emmc/reader.hpp"
#include "emmc/transports/gpio_bitbang.hpp"

#include <iostream>
#include <memory>

int main() {
    try {
        emmc::Reader reader(std::make_unique<emmc::transports::GpioBitbangTransport>());
        reader.init();

        emmc::PageBuffer page{};
        reader.read_page(0, page);

        emmc::HexOstreamDataSink sink(std::cout);
        sink.write(page.data(), page.size());
    } catch (const emmc::Error& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    return 0;
}
