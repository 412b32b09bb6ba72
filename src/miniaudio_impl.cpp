// miniaudio is single-header; its implementation is compiled once, here.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
