/* FileMan resolves names against one directory. The Session keeps one for the template's directory (where includes are found)
    and one for the output side.
*/
#pragma once
#include <string>
#include <defs.h>
#include <mapview.hpp>
#include <writeoutput.hpp>


class FileMan {
public:
    enum PathState {
        CNEP,      // Ce n'existe pas
        Directory, // it's a directory
        File,      // it's a file
        Other,     // it's something else (fifo, socket, device...)
        Error      // an error occurred when stat'ing it
    };

    std::string dir; // may be empty, meaning the working directory

    FileMan(std::string rdir); // construct the FileMan to manage the directory referenced by rdir.

    PathState checkPath(std::string path);

    std::string transmuted(std::string path); // dir + path, the name you'd actually hand to open()

    FileWriteOutput create(std::string where); // create (or truncate) a file and return the FileWriteOutput that controls it.
    // check isValid() on the result!

    MapView open(std::string thing); // memory map a file into the buffer-like MapView, returning an invalid
    // mapview if it doesn't exist (you MUST always check if mapview.isValid()!)
    // nothing is cached: every call maps the file fresh, so an include inside a loop sees the file as it is on every pass.
};
