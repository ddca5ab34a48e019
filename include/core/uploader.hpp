#pragma once

#include "core/file_entry.hpp"
#include "core/upload_types.hpp"
#include <string>

/**
 * @brief Transfer capability used by the uploader pool
 *
 * Implementations must be callable from several worker threads at once.
 * Failures are returned as SendResult values classified Transient or
 * Permanent; an exception escaping send() is treated as Transient.
 */
class Uploader
{
public:
    virtual ~Uploader() = default;

    virtual SendResult send(const FileEntry &entry) = 0;

    virtual std::string name() const = 0;
};
