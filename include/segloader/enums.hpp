#ifndef SEGLOADER_ENUMS_HPP
#define SEGLOADER_ENUMS_HPP

#define PARTEXT ".part"
#define STATEEXT ".segstate.json"
#define ASSEMBLYEXT ".assembling"
#define EMPTY_SHA "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"

namespace segloader
{
    enum class SourceKind
    {
        kHTTP,
        kTORRENT,
    };

    enum class SegmentState
    {
        // The segment is waiting in the pending queue.
        kWAITING,
        // A worker is fetching the segment.
        kRUNNING,
        // The partial file holds the complete byte range.
        kFINISHED,
        // The retry budget is exhausted.
        kFAILED,
    };

    enum class TransferPhase
    {
        kINITIALIZING,
        kDOWNLOADING,
        kCOMPLETED,
        kERROR,
    };

    enum class ErrorCode
    {
        // everything is ok
        SL_OK,
        // invalid size shorthand, header syntax or transfer option
        SL_BADCONFIG,
        // the source needs a transfer engine this build does not provide
        SL_UNSUPPORTEDSOURCE,
        // size / range support of the resource could not be determined
        SL_PROBEFAILED,
        // cURL error (connection, timeout, ...)
        SL_CURL,
        // HTTP returned a status code which does not represent success
        SL_BADSTATUS,
        // input output error on a partial or state file
        SL_IO,
        // a segment failed on every attempt of its retry budget
        SL_RETRIESEXHAUSTED,
        // transfer was cancelled, partial state is kept for resume
        SL_INTERRUPTED,
        // concatenating the segments into the destination failed
        SL_ASSEMBLYFAILED,
        // the assembled file does not match the expected digest
        SL_INTEGRITYFAILED,
        // the state file could not be read or written
        SL_STATE,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };

    const char* to_string(TransferPhase phase) noexcept;
    const char* to_string(ErrorCode code) noexcept;
}

#endif
