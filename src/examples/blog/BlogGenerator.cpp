// SPDX-License-Identifier: Apache-2.0

#include "BlogSchema.hpp"

#include <Refract/CodeGen/GeneratorMain.hpp>

int main(int argc, char const* argv[])
{
    return Refract::RunGenerator(blog::BlogSchema(), argc, argv);
}
