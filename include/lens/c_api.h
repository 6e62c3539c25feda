#pragma once

/**
 * C interface to scriptlens for hosts that cannot call C++ directly.
 *
 * Every function takes the script as a byte buffer plus length. A null
 * buffer, a length <= 0 or bytes that are not valid UTF-8 all produce the
 * function's documented sentinel. Strings returned as char* are allocated
 * by the library and must be released with lens_free_string(). Input
 * buffers are never retained past the call.
 */

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    LENS_SCRIPT_SHELL = 0,
    LENS_SCRIPT_PYTHON = 1,
    LENS_SCRIPT_PERL = 2,
    LENS_SCRIPT_RUBY = 3,
    LENS_SCRIPT_UNKNOWN = 4
} LensScriptType;

typedef enum {
    LENS_SCHEME_NANO = 0,
    LENS_SCHEME_VIM = 1,
    LENS_SCHEME_DEFAULT = 2
} LensHighlightScheme;

/**
 * @return Detected type, LENS_SCRIPT_UNKNOWN on invalid input
 */
LensScriptType lens_detect_script_type(const char* script, int len);

/**
 * @return 1 if the script passes every structural check, 0 otherwise
 *         (including invalid input)
 */
int lens_validate_script_syntax(const char* script, int len);

/**
 * @return 1 if the script carries a usable interpreter line, 0 otherwise
 */
int lens_validate_script_before_exec(const char* script, int len);

/**
 * @return Interpreter path ("/bin/sh" when the script names none), or
 *         NULL on invalid input. Free with lens_free_string().
 */
char* lens_parse_shebang(const char* script, int len);

/**
 * Interpreter and arguments as one buffer of NUL-separated tokens,
 * interpreter first, followed by an extra NUL.
 *
 * @param max_args Maximum number of tokens, interpreter included
 * @param count Receives the number of tokens; may be NULL
 * @return The buffer, or NULL on invalid input, max_args <= 0 or no
 *         shebang. Free with lens_free_string().
 */
char* lens_parse_shebang_with_args(const char* script, int len, int max_args, int* count);

/**
 * @return "Field: value" lines, "No metadata found" when there are none,
 *         or NULL on invalid input. Free with lens_free_string().
 */
char* lens_extract_script_metadata(const char* script, int len);

/**
 * @return Statistics summary, or NULL on invalid input.
 *         Free with lens_free_string().
 */
char* lens_get_script_stats(const char* script, int len);

/**
 * @return ANSI-colored script, or NULL on invalid input.
 *         Free with lens_free_string().
 */
char* lens_highlight_script(const char* script, int len, LensHighlightScheme scheme);

// Release a string returned by this library. NULL is ignored.
void lens_free_string(char* ptr);

int lens_get_theme_count(void);

/**
 * @return Static theme name (do not free), or NULL if index is out of range
 */
const char* lens_get_theme_name(int index);

// Static version string (do not free)
const char* lens_get_version(void);

#ifdef __cplusplus
}
#endif
