#include <iostream>
#include <string>
#include <thread>
#include "../include/spsc/channel.hpp"

int main() {
    auto [px, cx] = spsc::channel<std::string>();

    std::thread prod([px = std::move(px)]() mutable {
        if (!px.send("Ping")) std::cerr << "send failed: consumer gone\n";
        if (!px.send("Ping")) std::cerr << "send failed: consumer gone\n";
    });

    for (int i = 0; i < 2; ++i) {
        auto r = cx.recv();
        if (!r.ok()) {
            std::cerr << "recv failed: channel closed early\n";
            prod.join();
            return 1;
        }
        std::cout << "recv: " << r.value() << "\n";
    }

    prod.join();
    if (cx.recv().ok()) {
        std::cerr << "expected a closed channel\n";
        return 1;
    }
    std::cout << "channel closed, ping demo done\n";
    return 0;
}
