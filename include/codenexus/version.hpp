/*
 * Fallback version header for codenexus
 *
 * The build system passes CODENEXUS_VERSION_* as compile definitions taken from
 * project(VERSION ...). These defaults only apply when it does not.
 */

#pragma once

#ifndef CODENEXUS_VERSION_MAJOR
#define CODENEXUS_VERSION_MAJOR 0
#endif

#ifndef CODENEXUS_VERSION_MINOR
#define CODENEXUS_VERSION_MINOR 0
#endif

#ifndef CODENEXUS_VERSION_PATCH
#define CODENEXUS_VERSION_PATCH 0
#endif

#ifndef CODENEXUS_VERSION_STRING
#define CODENEXUS_VERSION_STRING "0.0.0+dev"
#endif
