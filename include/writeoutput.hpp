// WriteOutput is the append-only sink rendered data goes into. Nothing is ever read back out of it while rendering.
#pragma once
#include <string>
#include <defs.h>
#include <mapview.hpp>


struct WriteOutput {
    size_t written = 0; // total bytes accepted so far, less any a failed flush threw away

    virtual ~WriteOutput();

    virtual int write(const char* data, size_t length) = 0; // RENDER_EXIT_OK, or RENDER_EXIT_IO if the data can't go anywhere

    int write(std::string data);

    int write(MapView data);
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    bool move = false;
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(FileWriteOutput& f);

    FileWriteOutput(int fd);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file.

    bool isValid();

    using WriteOutput::write;

    int write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    int flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    using WriteOutput::write;

    int write(const char* data, size_t length);
};
