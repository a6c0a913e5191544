#pragma once

#define PENBRIDGE_VERSION "0.3.0"
