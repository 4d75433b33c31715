#pragma once

#include <cstdint>

/*
    Controls of the fake native library the tests load instead of libglfw.
*/
extern "C" {
struct SFakeIcon {
    int     count;
    int     width;
    int     height;
    uint8_t firstPixel[4];
};

void        fakeglfwReset();

void        fakeglfwRaiseError(int code, const char* description);

void        fakeglfwEmitWindowSize(void* window, int width, int height);
void        fakeglfwEmitKey(void* window, int key, int scancode, int action, int mods);
void        fakeglfwEmitChar(void* window, unsigned int codepoint);
void        fakeglfwEmitMouseButton(void* window, int button, int action, int mods);
void        fakeglfwEmitDrop(void* window, int count, const char** paths);
void        fakeglfwEmitMonitor(int event);

int         fakeglfwLastHint(int* value);
const char* fakeglfwLastStringHint(int* hint);
void        fakeglfwSizeLimits(int* limits);
SFakeIcon   fakeglfwIcon();
int         fakeglfwInputMode(void* window, int mode);
int         fakeglfwTerminated();
}
