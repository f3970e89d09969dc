#include <string>
#include <vector>

#include "app/HighlightDigestApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    highlightdigest::app::HighlightDigestApp app;
    return app.Run(args);
}
