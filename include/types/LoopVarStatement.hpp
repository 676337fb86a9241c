#pragma once
#include <directive.hpp>
#include <string>
#include <defs.h>


struct LoopVarStatement : Directive { // write the current element of the loop in progress (/** loopvar **/)
    LoopVarStatement(std::string arg, size_t s, size_t e);

    int execute(RenderState* state);
};
