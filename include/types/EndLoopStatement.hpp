#pragma once
#include <directive.hpp>
#include <string>
#include <defs.h>


struct EndLoopStatement : Directive { // advance the loop in progress, rewinding to the top of the body if there's anything left (/** endloop **/)
    EndLoopStatement(std::string arg, size_t s, size_t e);

    int execute(RenderState* state);
};
