#pragma once
#include <directive.hpp>
#include <string>
#include <defs.h>


struct IncludeStatement : Directive { // write a file from the template's directory into the output, verbatim (/** include name **/)
    IncludeStatement(std::string arg, size_t s, size_t e);

    int execute(RenderState* state);
};
