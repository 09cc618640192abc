#include "test.hpp"

int main(int argc, char* argv[]) {
    std::string filter = argc > 1 ? argv[1] : "";
    return px::test::TestRunner::instance().run(filter) > 0 ? 1 : 0;
}
