#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "app/NewscastApp.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        newscast::app::NewscastApp app;
        return app.Run(args);
    } catch (const std::exception& e) {
        std::cerr << "[newscast] Internal error: " << e.what() << std::endl;
        return newscast::app::kExitInternal;
    }
}
