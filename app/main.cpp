#include <cli/cli_common.hpp>

int main(int argc, char* argv[]) {
    return funnel::cli::command_compare(argc, argv);
}
