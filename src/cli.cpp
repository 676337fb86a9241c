// the command line: three paths in, an exit status out.
#include <defs.h>
#include <cstdio>
#include <string>
#include <session.hpp>
#include <template.hpp>
#include <render.hpp>
#include <writeoutput.hpp>
#include <cli.hpp>


int runQuill(int argc, char** argv) {
    printf("\033[1mQuill v1.0\033[0m\n");
    if (argc != 4) {
        printf(ERROR "Expected exactly three arguments, got %d.\n", argc - 1);
        printf("\tusage: %s <template> <output> <context>\n", argv[0]);
        return RENDER_EXIT_USAGE;
    }
    std::string templatePath = argv[1];
    std::string outputPath = argv[2];
    std::string contextPath = argv[3];

    int status = RENDER_EXIT_OK;
    Template* tmpl = Template::open(templatePath, &status);
    if (tmpl == NULL) {
        printf(ERROR "Couldn't load %s (%s).\n", templatePath.c_str(), renderErrorName(status));
        return status;
    }
    printf(INFO "Loaded %s: %zu directives.\n", templatePath.c_str(), tmpl -> directives.size());

    Session session(tmpl -> dir, "");
    status = session.context.load(contextPath);
    if (status != RENDER_EXIT_OK) {
        printf(ERROR "Couldn't load context %s (%s).\n", contextPath.c_str(), renderErrorName(status));
        delete tmpl;
        return status;
    }
    printf(INFO "Loaded context %s: %zu entries.\n", contextPath.c_str(), session.context.size());

    FileWriteOutput out = session.create(outputPath);
    if (!out.isValid()) {
        delete tmpl;
        return RENDER_EXIT_IO;
    }
    printf(INFO "Rendering %s to %s.\n", templatePath.c_str(), outputPath.c_str());
    status = renderTemplate(tmpl, &session, &out);
    delete tmpl;
    int flushed = out.flush(); // whatever made it into the buffer goes out either way
    if (status == RENDER_EXIT_OK) {
        status = flushed;
    }
    if (status != RENDER_EXIT_OK) {
        printf(ERROR "Render failed with %s; %s holds %zu bytes of partial output.\n", renderErrorName(status), outputPath.c_str(), out.written);
        return status;
    }
    printf(INFO "Wrote %zu bytes.\n", out.written);
    printf("\033[1;33mRender complete!\033[0m\n");
    return RENDER_EXIT_OK;
}
