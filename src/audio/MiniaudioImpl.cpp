// SPDX-License-Identifier: Apache-2.0

// The one translation unit that compiles miniaudio. AudioPlayer and DecoderAudioSource
// include <miniaudio.h> without the implementation define.
// The high-level engine and generator APIs are not used.
#define MA_NO_ENGINE
#define MA_NO_GENERATION
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
