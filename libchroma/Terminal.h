#pragma once

#include <libchroma/Terminal/Ansi.h>
#include <libchroma/Terminal/TextStyle.h>
