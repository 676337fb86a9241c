#pragma once
#include <directive.hpp>
#include <string>
#include <defs.h>


struct VariableStatement : Directive { // write a scalar out of the context (/** variable name **/). Missing names write nothing.
    VariableStatement(std::string arg, size_t s, size_t e);

    int execute(RenderState* state);
};
