// Session is the engine object: the context data and the FileMans everything resolves through.
// Sessions should not be mutated except at the start by the main function (or a test). Every render gets a pointer to one.
#pragma once
#include <defs.h>
#include <string>
#include <context.hpp>
#include <fileman.hpp>


struct Session {
    Context context;
    FileMan input; // the template's directory; includes are found here
    FileMan output;

    Session(std::string inDir, std::string outDir);

    const ContextValue* lookup(const std::string& name); // forwards to context

    FileMan::PathState checkPath(std::string path); // these all redirect to input

    std::string transmuted(std::string path);

    MapView open(std::string path);

    FileWriteOutput create(std::string path); // this one goes to output
};
