#pragma once

#ifndef PAGENORM_VERSION_STRING
#define PAGENORM_VERSION_STRING "0.1.0"
#endif
