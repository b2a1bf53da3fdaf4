#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <boost/log/core.hpp>

int main(int argc, char** argv) {
    // components log through the core; keep test output to doctest's own
    boost::log::core::get()->set_logging_enabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
