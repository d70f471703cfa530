#pragma once

#include "backup/backup_config.hpp"
#include "backup/exclusion_filter.hpp"
#include "common/backup_status.hpp"
#include <functional>
#include <string>

using OutputCallback = std::function<void(const std::string&)>;

struct SyncOutcome {
    ErrorKind error = ErrorKind::None;  // None, SourceUnreachable, Transfer, Permission or Interrupted
    int exitCode = 0;
    std::string message;

    bool succeeded() const { return error == ErrorKind::None; }

    static SyncOutcome success() { return SyncOutcome(); }
    static SyncOutcome failure(ErrorKind error, int exitCode, const std::string& message) {
        SyncOutcome outcome;
        outcome.error = error;
        outcome.exitCode = exitCode;
        outcome.message = message;
        return outcome;
    }
};

// Brings a destination tree in line with a source tree.
//
// A conforming implementation copies every non-excluded source entry to the
// destination, removes destination entries that are missing at the source or
// excluded, replaces a file whose content differs by a new inode (never by
// writing into the existing one) and leaves identical files untouched. A
// failed reconcile may leave the destination incomplete but must not modify
// the content of files it did not replace.
class SyncExecutor {
public:
    virtual ~SyncExecutor() = default;

    virtual SyncOutcome reconcile(const SourceLocator& source,
                                  const std::string& destination,
                                  const ExclusionFilter& exclusions) = 0;

    virtual std::string name() const = 0;
};
