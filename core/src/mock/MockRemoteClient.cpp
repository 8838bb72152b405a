#include "iftpfm/MockRemoteClient.hpp"

#include <algorithm>

namespace iftpfm {

namespace {

void splitPath(const std::string& path, std::string& dir, std::string& name) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        dir = "/";
        name = path;
        return;
    }
    dir = slash == 0 ? "/" : path.substr(0, slash);
    name = path.substr(slash + 1);
}

} // namespace

void MockRemoteFs::mkdir(const std::string& host, const std::string& dir) {
    std::lock_guard<std::mutex> lk(mtx_);
    dirs_[host].insert(dir);
}

void MockRemoteFs::put(const std::string& host, const std::string& path,
                       const std::string& data, std::int64_t mtime) {
    std::string dir, name;
    splitPath(path, dir, name);
    std::lock_guard<std::mutex> lk(mtx_);
    dirs_[host].insert(dir);
    hosts_[host][dir][name] = File{data, mtime};
}

bool MockRemoteFs::exists(const std::string& host, const std::string& path) const {
    std::string dir, name;
    splitPath(path, dir, name);
    std::lock_guard<std::mutex> lk(mtx_);
    auto h = hosts_.find(host);
    if (h == hosts_.end())
        return false;
    auto d = h->second.find(dir);
    return d != h->second.end() && d->second.count(name) != 0;
}

std::string MockRemoteFs::read(const std::string& host, const std::string& path) const {
    std::string dir, name;
    splitPath(path, dir, name);
    std::lock_guard<std::mutex> lk(mtx_);
    auto h = hosts_.find(host);
    if (h == hosts_.end())
        return {};
    auto d = h->second.find(dir);
    if (d == h->second.end())
        return {};
    auto f = d->second.find(name);
    return f == d->second.end() ? std::string() : f->second.data;
}

std::set<std::string> MockRemoteFs::names(const std::string& host,
                                          const std::string& dir) const {
    std::set<std::string> out;
    std::lock_guard<std::mutex> lk(mtx_);
    auto h = hosts_.find(host);
    if (h == hosts_.end())
        return out;
    auto d = h->second.find(dir);
    if (d == h->second.end())
        return out;
    for (const auto& kv : d->second)
        out.insert(kv.first);
    return out;
}

void MockRemoteFs::injectFault(const std::string& host, Fault f, int count,
                               const std::string& onlyName) {
    std::lock_guard<std::mutex> lk(mtx_);
    faults_[host][f] = FaultSpec{count, onlyName};
}

bool MockRemoteFs::consumeFault(const std::string& host, Fault f,
                                const std::string& name) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto h = faults_.find(host);
    if (h == faults_.end())
        return false;
    auto it = h->second.find(f);
    if (it == h->second.end())
        return false;
    FaultSpec& spec = it->second;
    if (!spec.onlyName.empty() && spec.onlyName != name)
        return false;
    if (spec.remaining == 0)
        return false;
    if (spec.remaining > 0)
        --spec.remaining;
    return true;
}

std::vector<std::string> MockRemoteFs::journal() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return journal_;
}

void MockRemoteFs::record(const std::string& line) {
    std::lock_guard<std::mutex> lk(mtx_);
    journal_.push_back(line);
}

MockRemoteClient::MockRemoteClient(std::shared_ptr<MockRemoteFs> fs, Protocol p)
    : fs_(std::move(fs)), protocol_(p) {}

bool MockRemoteClient::fault(MockRemoteFs::Fault f, const std::string& name,
                             ErrorKind kind, ClientError& err) {
    if (!fs_->consumeFault(host_, f, name))
        return false;
    err.set(kind, "injected failure on " + host_ + (name.empty() ? "" : ": " + name));
    return true;
}

bool MockRemoteClient::ready(ClientError& err) const {
    if (!connected_ || !loggedIn_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    return true;
}

bool MockRemoteClient::connect(const std::string& host, std::uint16_t,
                               std::chrono::milliseconds, ClientError& err) {
    if (host.empty()) {
        err.set(ErrorKind::Connection, "host is required");
        return false;
    }
    host_ = host;
    if (fault(MockRemoteFs::Fault::Connect, {}, ErrorKind::Connection, err))
        return false;
    connected_ = true;
    cwd_ = "/";
    return true;
}

bool MockRemoteClient::login(const std::string& user, const Credential& cred,
                             ClientError& err) {
    if (!connected_) {
        err.set(ErrorKind::Connection, "not connected");
        return false;
    }
    if (user.empty() || (!cred.password && !cred.key_path)) {
        err.set(ErrorKind::Auth, "missing credentials");
        return false;
    }
    if (fault(MockRemoteFs::Fault::Login, {}, ErrorKind::Auth, err))
        return false;
    loggedIn_ = true;
    return true;
}

bool MockRemoteClient::setBinaryMode(ClientError& err) {
    if (!ready(err))
        return false;
    binary_ = true;
    return true;
}

void MockRemoteClient::close() {
    connected_ = false;
    loggedIn_ = false;
    binary_ = false;
}

bool MockRemoteClient::changeDirectory(const std::string& path, ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::ChangeDirectory, {}, ErrorKind::Protocol, err))
        return false;
    const std::string target = joinRemotePath(cwd_, path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto& dirs = fs_->dirs_[host_];
    if (target != "/" && dirs.count(target) == 0) {
        err.set(ErrorKind::Protocol, "550 no such directory: " + target);
        return false;
    }
    cwd_ = target;
    return true;
}

bool MockRemoteClient::list(std::vector<std::string>& out, ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::List, {}, ErrorKind::Protocol, err))
        return false;
    out.clear();
    for (const auto& n : fs_->names(host_, cwd_))
        out.push_back(n);
    return true;
}

bool MockRemoteClient::modTime(const std::string& name, std::int64_t& mtime,
                               ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::ModTime, name, ErrorKind::Protocol, err))
        return false;
    const std::string path = joinRemotePath(cwd_, name);
    std::string dir, base;
    splitPath(path, dir, base);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto& files = fs_->hosts_[host_][dir];
    auto it = files.find(base);
    if (it == files.end()) {
        err.set(ErrorKind::Protocol, "550 not found: " + path);
        return false;
    }
    mtime = it->second.mtime;
    return true;
}

bool MockRemoteClient::size(const std::string& name, std::uint64_t& bytes,
                            ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::Size, name, ErrorKind::Protocol, err))
        return false;
    const bool lie = fs_->consumeFault(host_, MockRemoteFs::Fault::SizeLie, name);
    const std::string path = joinRemotePath(cwd_, name);
    std::string dir, base;
    splitPath(path, dir, base);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto& files = fs_->hosts_[host_][dir];
    auto it = files.find(base);
    if (it == files.end()) {
        err.set(ErrorKind::Protocol, "550 not found: " + path);
        return false;
    }
    bytes = it->second.data.size() + (lie ? 1 : 0);
    return true;
}

bool MockRemoteClient::download(const std::string& name, ByteSink& sink,
                                ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::Download, name, ErrorKind::Io, err))
        return false;
    const std::string path = joinRemotePath(cwd_, name);
    if (!fs_->exists(host_, path)) {
        err.set(ErrorKind::Protocol, "550 not found: " + path);
        return false;
    }
    const std::string data = fs_->read(host_, path);
    std::string werr;
    // Deliver in chunks like a real transfer.
    const std::size_t chunk = 4096;
    for (std::size_t off = 0; off < data.size(); off += chunk) {
        const std::size_t n = std::min(chunk, data.size() - off);
        if (!sink.write(data.data() + off, n, werr)) {
            err.set(ErrorKind::Io, "local write failed: " + werr);
            return false;
        }
    }
    return true;
}

bool MockRemoteClient::upload(const std::string& name, ByteSource& source,
                              ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::Upload, name, ErrorKind::Io, err))
        return false;
    std::string data;
    std::string rerr;
    char buf[4096];
    for (;;) {
        const std::size_t n = source.read(buf, sizeof(buf), rerr);
        if (n == 0) {
            if (!rerr.empty()) {
                err.set(ErrorKind::Io, "local read failed: " + rerr);
                return false;
            }
            break;
        }
        data.append(buf, n);
    }
    if (fs_->consumeFault(host_, MockRemoteFs::Fault::ShortUpload, name) && !data.empty())
        data.pop_back();
    const std::string path = joinRemotePath(cwd_, name);
    fs_->put(host_, path, data, 0);
    fs_->record(host_ + ":upload " + name);
    return true;
}

bool MockRemoteClient::rename(const std::string& from, const std::string& to,
                              ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::Rename, to, ErrorKind::Protocol, err))
        return false;
    const std::string src = joinRemotePath(cwd_, from);
    const std::string dst = joinRemotePath(cwd_, to);
    std::string sdir, sname, ddir, dname;
    splitPath(src, sdir, sname);
    splitPath(dst, ddir, dname);
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto& host = fs_->hosts_[host_];
        auto& sfiles = host[sdir];
        auto it = sfiles.find(sname);
        if (it == sfiles.end()) {
            err.set(ErrorKind::Protocol, "550 not found: " + src);
            return false;
        }
        auto& dfiles = host[ddir];
        if (dfiles.count(dname) != 0) {
            err.set(ErrorKind::Protocol, "553 target exists: " + dst);
            return false;
        }
        MockRemoteFs::File f = it->second;
        sfiles.erase(it);
        dfiles[dname] = f;
    }
    fs_->record(host_ + ":rename " + from + " " + to);
    return true;
}

bool MockRemoteClient::remove(const std::string& name, ClientError& err) {
    if (!ready(err))
        return false;
    if (fault(MockRemoteFs::Fault::Remove, name, ErrorKind::Protocol, err))
        return false;
    const std::string path = joinRemotePath(cwd_, name);
    std::string dir, base;
    splitPath(path, dir, base);
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto& files = fs_->hosts_[host_][dir];
        if (files.erase(base) == 0) {
            err.set(ErrorKind::Protocol, "550 not found: " + path);
            return false;
        }
    }
    fs_->record(host_ + ":delete " + name);
    return true;
}

} // namespace iftpfm
