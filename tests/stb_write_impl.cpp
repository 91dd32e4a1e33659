// stb_image_write bodies for the test fixtures that encode PNGs in memory.

#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "stb_image_write.h"
