// Single translation unit holding the stb_image bodies used to decode
// image assets.

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG

#include "stb_image.h"
