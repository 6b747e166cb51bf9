#include <declex/declexMain/declexMain.hpp>

#include <iostream>
#include <string_view>
#include <vector>

int main(int argc, char** argv)
{
    std::vector<std::string_view> elements(argc - 1);
    for (int i = 1; i < argc; i++)
    {
        elements[i - 1] = argv[i];
    }
    return declex::main(elements, std::cin, &llvm::errs(), &llvm::outs());
}
