#include "lowrank_cli/app.hpp"

#include <cstdio>

int main(int argc, char** argv) {
		return lowrank_cli::run(argc, argv, stdout, stderr);
}
