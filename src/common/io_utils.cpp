#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw internal_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_atomically(const fs::path &path, const string &content) {
    fs::create_directories(path.parent_path());
    fs::path tmp = path;
    tmp += ".tmp." + to_string(getpid()) + "." + to_string(gettid());
    {
        ofstream fout(tmp, ios::binary | ios::trunc);
        if (!fout) throw internal_error("unable to write file " + tmp.string());
        fout << content;
        fout.flush();
        if (!fout) throw internal_error("unable to write file " + tmp.string());
    }
    fs::rename(tmp, path);
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == "..")
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

string assert_safe_component(const string &component) {
    if (component.empty() || component == "." || component == ".." ||
        component.find('/') != string::npos || component.find('\0') != string::npos)
        throw runtime_error("path component is not safe " + component);
    return component;
}

void copy_directory(const fs::path &src, const fs::path &dest) {
    fs::create_directories(dest);
    fs::copy(src, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
}

scoped_file_lock::scoped_file_lock() {
    valid = false;
}

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared) {
    fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    if (flock(fd, shared ? LOCK_SH : LOCK_EX) != 0) {
        int err = errno;
        close(fd);
        throw system_error(err, system_category(), "unable to lock " + path.string());
    }
    valid = true;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    return *this;
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

scoped_file_lock lock_directory(const fs::path &dir, bool shared) {
    fs::create_directories(dir);
    fs::path lock_file = dir / ".lock";
    if (fs::is_directory(lock_file))
        fs::remove_all(lock_file);
    return scoped_file_lock(lock_file, shared);
}

}  // namespace grader
