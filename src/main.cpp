#include <wasmbox/cli/cli.h>

int main(int argc, char** argv)
{
    return wasmbox::cli::run(argc, argv);
}
