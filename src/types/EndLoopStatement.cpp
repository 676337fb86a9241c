#include <types/EndLoopStatement.hpp>
#include <renderstate.hpp>
#include <cstdio>


EndLoopStatement::EndLoopStatement(std::string arg, size_t s, size_t e) : Directive(ENDLOOP, arg, s, e) {}

int EndLoopStatement::execute(RenderState* state) {
    if (!state -> looping) {
        printf(ERROR "endloop at offset %zu doesn't close anything.\n", start);
        return RENDER_EXIT_LOOPSTATE;
    }
    LoopFrame& loop = state -> loop;
    loop.index ++;
    if (loop.index < loop.list -> size()) { // go around again
        state -> cursor = loop.bodyStart;
        state -> next = loop.bodyToken;
    }
    else {
        state -> looping = false; // the render loop already put the cursor past us
        loop.list = NULL;
    }
    return RENDER_EXIT_OK;
}
