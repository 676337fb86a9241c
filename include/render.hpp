// the render loop. Flush the literal text up to the next directive, run the directive, repeat from wherever it left the cursor.
#pragma once
#include <defs.h>
#include <string>


int renderTemplate(Template* tmpl, Session* session, WriteOutput* out); // returns RENDER_EXIT_OK or the first failure.
// output written before a failure stays written.

int renderToString(Template* tmpl, Session* session, std::string& result); // same thing into a string. result gets the partial output on failure
