// Quill
//
// A small directive templating engine. A template is any text file; directives inside it look like
//
//     /** include header.html **/    copies header.html (found next to the template) in verbatim
//     /** variable title **/         writes the string `title` from the context, or nothing if there isn't one
//     /** loopover posts **/         repeats everything up to the next endloop once per element of the list `posts`
//     /** loopvar **/                writes the current element of the loop
//     /** endloop **/
//
// The context is a JSON object of strings and lists of strings. Loops don't nest.
//
// usage: quill <template> <output> <context>

#include <cli.hpp>


int main(int argc, char** argv) {
    return runQuill(argc, argv);
}
