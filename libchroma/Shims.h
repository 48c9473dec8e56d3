#pragma once

#include <libchroma/Shims/Cpp23/expected.h>
