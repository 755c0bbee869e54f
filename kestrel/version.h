#pragma once

#ifndef KESTREL_VERSION
#define KESTREL_VERSION "1.0.0"
#endif

#define KESTREL_NAME "kestrel"
