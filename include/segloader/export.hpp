#ifndef SEGLOADER_EXPORT_HPP
#define SEGLOADER_EXPORT_HPP


#ifdef SEGLOADER_STATIC
// As a static library: no symbol import/export.
#  define SEGLOADER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef SEGLOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define SEGLOADER_API __declspec(dllexport)
#    else
#         define SEGLOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define SEGLOADER_API __declspec(dllimport)
#    else
#         define SEGLOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
