#include <iostream>

#include "BotBrain.h"
#include "SpinBrain.h"

// example external bot: speaks the line protocol on stdin/stdout
int main()
{
    SpinBrain brain;

    if (auto error = runBrain(brain, std::cin, std::cout))
    {
        std::cerr << "Error: " << error->describe() << std::endl;
        return 1;
    }

    return 0;
}
