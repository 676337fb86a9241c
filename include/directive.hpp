#pragma once
#include <defs.h>
#include <string>


struct Directive { // superclass
    enum Kind {
        INCLUDE,
        VARIABLE,
        LOOPOVER,
        LOOPVAR,
        ENDLOOP
    } kind;

    std::string argument; // may be empty (loopvar and endloop don't care)
    size_t start; // the directive's span in the template: [start, end)
    size_t end;

    Directive(Kind k, std::string arg, size_t s, size_t e);

    virtual ~Directive();

    virtual int execute(RenderState* state) = 0; // true virtual function
    // by the time this is called the render loop has already moved state -> cursor to `end` and state -> next past us;
    // a directive only touches them if it wants to go somewhere else. Returns one of the RENDER_EXIT_ codes.

    std::string describe(); // "loopover items", for log lines

    static const char* keyword(Kind k);
};


Directive* makeDirective(Directive::Kind kind, std::string argument, size_t start, size_t end); // the dispatcher: one Directive subclass per keyword
