// Platform-agnostic process implementation
// Uses conditional compilation to select platform-specific implementation

#ifdef _WIN32
    #error "procscope isolates work with fork() and requires a POSIX platform"
#else
    #include "process_posix.cpp"
#endif
