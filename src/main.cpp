#include <iostream>
#include <memory>

#include "parley/ParleyApplication.hpp"

int main() {
    try {
        auto app = parley::ParleyApplication::create();
        app->printBanner();
        return app->run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
