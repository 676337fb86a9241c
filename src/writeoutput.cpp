// the output sinks. FileWriteOutput buffers into 4kb blocks, StringWriteOutput just keeps everything.
#include <writeoutput.hpp>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>


WriteOutput::~WriteOutput() {}

int WriteOutput::write(std::string data) {
    return write(data.c_str(), data.size());
}

int WriteOutput::write(MapView data) {
    if (data.len() == 0) {
        return RENDER_EXIT_OK;
    }
    return write(data.cbuf(), data.len());
}


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

FileWriteOutput::FileWriteOutput(FileWriteOutput& f) {
    file = f.file;
    written = f.written;
    bufferPos = f.bufferPos;
    memcpy(buffer, f.buffer, bufferPos);
    f.bufferPos = 0;
    f.move = true; // the old one lets go of the descriptor without closing it
}

bool FileWriteOutput::isValid() {
    return file != -1;
}

int FileWriteOutput::write(const char* data, size_t length) {
    if (file == -1) {
        return RENDER_EXIT_IO;
    }
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            int r = flush();
            if (r != RENDER_EXIT_OK) {
                return r;
            }
        }
        else {
            memcpy(buffer + bufferPos, data, writeSize);
            bufferPos += writeSize;
            written += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
    return RENDER_EXIT_OK;
}

int FileWriteOutput::flush() {
    size_t done = 0;
    while (done < bufferPos) {
        ssize_t r = ::write(file, buffer + done, bufferPos - done);
        if (r == -1) {
            if (errno == EINTR) {
                continue;
            }
            printf(ERROR "Couldn't write %zu buffered bytes to the output file.\n", bufferPos - done);
            perror("\twrite");
            written -= bufferPos - done; // those never made it to the file
            bufferPos = 0;
            return RENDER_EXIT_IO;
        }
        done += r;
    }
    bufferPos = 0;
    return RENDER_EXIT_OK;
}

FileWriteOutput::~FileWriteOutput() {
    if (!move && file != -1) { // allow this file descriptor to be moved into another FileWriteOutput without being closed.
        flush(); // anything left over is partial output from a failed render; flush() already complains if it can't be written
        ::close(file);
    }
}


int StringWriteOutput::write(const char* data, size_t length) {
    content.append(data, length);
    written += length;
    return RENDER_EXIT_OK;
}
