#pragma once
#include <directive.hpp>
#include <string>
#include <defs.h>


struct LoopOverStatement : Directive { // start iterating over a list out of the context (/** loopover name **/)
    size_t endToken = (size_t)-1; // index of the endloop that closes us, filled in by tokenize(). (size_t)-1 if there isn't one

    LoopOverStatement(std::string arg, size_t s, size_t e);

    int execute(RenderState* state);
};
