#ifndef TIDYIGNORE_VERSION_HPP
#define TIDYIGNORE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define TIDYIGNORE_VERSION_MAJOR 0
#define TIDYIGNORE_VERSION_MINOR 3
#define TIDYIGNORE_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "0.3.0" or "2025.07.31-1".
 */
#define TIDYIGNORE_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* TIDYIGNORE_VERSION = TIDYIGNORE_VERSION_STR;

#endif /* TIDYIGNORE_VERSION_HPP */
