// RenderState is everything that changes while one template renders. It lives for exactly one pass and is thrown away after.
#pragma once
#include <defs.h>
#include <string>
#include <vector>


struct LoopFrame { // the one (and only) loop in progress
    const std::vector<std::string>* list = NULL; // owned by the Context, which doesn't change while we render
    size_t index = 0;
    size_t bodyStart = 0; // byte offset just past the loopover, where every iteration starts emitting from
    size_t bodyToken = 0; // directive index just past the loopover
};


struct RenderState {
    Template* tmpl;
    Session* session;
    WriteOutput* out;

    size_t cursor = 0; // byte offset in the template; only ever moves backwards when an endloop rewinds to loop.bodyStart
    size_t next = 0; // index of the next directive to run

    bool looping = false; // is `loop` live?
    LoopFrame loop;

    RenderState(Template* t, Session* s, WriteOutput* o);
};
