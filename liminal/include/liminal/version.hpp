#pragma once

#define LIMINAL_VERSION "0.4.0"
