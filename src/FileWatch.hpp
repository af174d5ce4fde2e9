#pragma once
#include <filesystem>
#include <string>

// Polls a file's modification time.
class FileWatch
{
public:
    explicit FileWatch(std::string path = {});

    void reset(std::string path);
    const std::string& path() const { return _path; }
    bool exists() const;

    // True once per modification. The first call only records the baseline.
    bool changed();
    // Forget the baseline, e.g. after the caller reloaded on its own.
    void rearm();

private:
    bool getFileMTime(std::filesystem::file_time_type& out) const;

private:
    std::string _path;
    std::filesystem::file_time_type _mtime;
    bool _primed;
};
