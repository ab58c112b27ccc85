#include "games/connectz/Main.hpp"

int main(int ac, char* av[]) { return cz::Main::main(ac, av); }
