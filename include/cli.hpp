// runs quill as the command line sees it: quill <template> <output> <context>
#pragma once
#include <defs.h>


int runQuill(int argc, char** argv); // returns the process exit status. RENDER_EXIT_USAGE if argc isn't 4,
// otherwise RENDER_EXIT_OK or the status of the first failure. The output file is only created once the template and context have loaded.
