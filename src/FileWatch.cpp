#include "FileWatch.hpp"

FileWatch::FileWatch(std::string path)
    : _path{ std::move(path) }
    , _mtime{}
    , _primed{ false }
{
}

void FileWatch::reset(std::string path)
{
    _path = std::move(path);
    _mtime = {};
    _primed = false;
}

bool FileWatch::exists() const
{
    std::error_code ec;
    return !_path.empty() && std::filesystem::exists(_path, ec);
}

bool FileWatch::getFileMTime(std::filesystem::file_time_type& out) const
{
    std::error_code ec;
    auto t = std::filesystem::last_write_time(_path, ec);
    if (ec) return false;
    out = t;
    return true;
}

bool FileWatch::changed()
{
    if (_path.empty()) return false;
    std::filesystem::file_time_type cur;
    if (!getFileMTime(cur)) return false;
    if (!_primed) { _mtime = cur; _primed = true; return false; }
    if (cur == _mtime) return false;
    _mtime = cur;
    return true;
}

void FileWatch::rearm()
{
    std::filesystem::file_time_type cur;
    if (getFileMTime(cur)) { _mtime = cur; _primed = true; }
}
