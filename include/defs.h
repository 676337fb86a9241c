#pragma once
#include <cstddef>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR   "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "

#define RENDER_EXIT_OK        0
#define RENDER_EXIT_IO        1 // template, context, include or output file unreadable/unwritable
#define RENDER_EXIT_PARSE     2 // bad directive syntax, unknown keyword, malformed context
#define RENDER_EXIT_TYPE      3 // loopover on a scalar
#define RENDER_EXIT_LOOPSTATE 4 // loopvar/endloop with no active loop, or a nested loopover
#define RENDER_EXIT_USAGE     5 // only used by the command line front end

#define DIRECTIVE_OPEN  "/**"
#define DIRECTIVE_CLOSE "**/"

#define OUTPUT_FILE_MODE 0644


struct Directive; // forward-declarations for everything, same as always: keeps the include web small
struct Template;
struct Context;
struct ContextValue;
struct RenderState;
struct LoopFrame;
struct WriteOutput;
struct FileWriteOutput;
struct StringWriteOutput;
class MapView;
class FileMan;
struct Session;


const char* renderErrorName(int code); // "IOError", "ParseError", etc. for log lines
