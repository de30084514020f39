//
// Semantic snapshot reader
//
// Reads the textual snapshot format (parenthesized forms, see SPEC_FULL.md
// section 10) into a compilation. Example:
//
//   (unit "R.cs")
//   (type System.Object class (special object))
//   (type System.IDisposable interface)
//   (type System.IntPtr struct (special intptr))
//   (type R class @3:14 (implements System.IDisposable))
//   (field R handle System.IntPtr)
//   (method R NativeOpen static (returns System.IntPtr) (dllimport "native"))
//   (method R Open (body
//     (block (expr (assign @5:9 (field_ref R handle (this)) (call R NativeOpen))))))
//

#pragma once

#include "compilation.hh"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace opcheck {

class snapshot_error : public std::runtime_error {
public:
    snapshot_error(const std::string& msg, std::string file, int line, int column)
        : std::runtime_error(msg),
          file_(std::move(file)),
          line_(line),
          column_(column) {
    }

    [[nodiscard]] const std::string& file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] int column() const { return column_; }

private:
    std::string file_;
    int line_;
    int column_;
};

/// Read a snapshot from text.
/// @param source_name Name used in error positions
/// @throws snapshot_error on syntax or reference errors
compilation read_snapshot(const std::string& text, const std::string& source_name = "<string>");

/// Read a snapshot file.
/// @throws std::runtime_error if the file cannot be read, snapshot_error on bad content
compilation read_snapshot_file(const std::filesystem::path& path);

} // namespace opcheck
