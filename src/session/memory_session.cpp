/**
 * @file memory_session.cpp
 * @brief memory_filesystem and memory_session implementation
 */

#include "async_sftp/session/memory_session.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <map>
#include <system_error>

namespace async_sftp {

namespace {

constexpr uint32_t type_directory = 0040000U;
constexpr uint32_t type_regular = 0100000U;

auto now_seconds() -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto parent_of(const std::string& path) -> std::string {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

auto name_of(const std::string& path) -> std::string {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

auto to_bytes(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    std::transform(text.begin(), text.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

auto sftp_failure(int64_t status, std::string message) -> native_error {
    return native_error{native_origin::sftp, status, std::move(message)};
}

}  // namespace

// ============================================================================
// memory_filesystem
// ============================================================================

memory_filesystem::memory_filesystem() {
    node root;
    root.directory = true;
    root.permissions = default_directory_mode;
    root.modified_time = now_seconds();
    nodes_.emplace("/", std::move(root));
}

auto memory_filesystem::normalize(std::string_view path) -> std::string {
    std::string result;
    result.reserve(path.size() + 1);
    if (path.empty() || path.front() != '/') {
        result.push_back('/');
    }
    for (char c : path) {
        if (c == '/' && !result.empty() && result.back() == '/') {
            continue;
        }
        result.push_back(c);
    }
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

auto memory_filesystem::add_directory(const std::string& path, uint32_t mode) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_directory_locked(normalize(path), mode);
}

auto memory_filesystem::add_directory_locked(const std::string& path, uint32_t mode) -> bool {
    auto it = nodes_.find(path);
    if (it != nodes_.end()) {
        return it->second.directory;
    }
    if (!add_directory_locked(parent_of(path), default_directory_mode)) {
        return false;
    }
    node entry;
    entry.directory = true;
    entry.permissions = mode;
    entry.modified_time = now_seconds();
    nodes_.emplace(path, std::move(entry));
    link_child(path);
    return true;
}

auto memory_filesystem::add_file(const std::string& path, std::vector<std::byte> content,
                                 uint32_t mode) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto normalized = normalize(path);
    if (normalized == "/" || !add_directory_locked(parent_of(normalized), default_directory_mode)) {
        return false;
    }

    auto it = nodes_.find(normalized);
    if (it != nodes_.end()) {
        if (it->second.directory) {
            return false;
        }
        it->second.content = std::move(content);
        it->second.permissions = mode;
        it->second.modified_time = now_seconds();
        return true;
    }

    node entry;
    entry.content = std::move(content);
    entry.permissions = mode;
    entry.modified_time = now_seconds();
    nodes_.emplace(normalized, std::move(entry));
    link_child(normalized);
    return true;
}

auto memory_filesystem::add_file(const std::string& path, std::string_view content,
                                 uint32_t mode) -> bool {
    return add_file(path, to_bytes(content), mode);
}

auto memory_filesystem::read_file(const std::string& path) const
    -> std::optional<std::vector<std::byte>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.directory) {
        return std::nullopt;
    }
    return it->second.content;
}

auto memory_filesystem::exists(const std::string& path) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.count(normalize(path)) > 0;
}

auto memory_filesystem::is_directory(const std::string& path) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.directory;
}

auto memory_filesystem::attributes_of(const node& entry) const -> remote_attributes {
    remote_attributes attrs;
    attrs.size = entry.directory ? 4096U : static_cast<uint64_t>(entry.content.size());
    attrs.permissions = (entry.directory ? type_directory : type_regular) | entry.permissions;
    attrs.modified_time = entry.modified_time;
    attrs.access_time = entry.modified_time;
    attrs.uid = 1000;
    attrs.gid = 1000;
    return attrs;
}

auto memory_filesystem::stat(const std::string& path) const -> std::optional<remote_attributes> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return attributes_of(it->second);
}

auto memory_filesystem::make_directory(const std::string& path, uint32_t mode) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto normalized = normalize(path);
    if (nodes_.count(normalized) > 0) {
        return sftp_status::file_already_exists;
    }
    auto parent = nodes_.find(parent_of(normalized));
    if (parent == nodes_.end()) {
        return sftp_status::no_such_file;
    }
    if (!parent->second.directory) {
        return sftp_status::not_a_directory;
    }

    node entry;
    entry.directory = true;
    entry.permissions = mode;
    entry.modified_time = now_seconds();
    nodes_.emplace(normalized, std::move(entry));
    link_child(normalized);
    return sftp_status::ok;
}

auto memory_filesystem::rename(const std::string& from, const std::string& to) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto source = normalize(from);
    auto target = normalize(to);

    auto it = nodes_.find(source);
    if (it == nodes_.end() || source == "/") {
        return sftp_status::no_such_file;
    }
    if (nodes_.count(target) > 0) {
        return sftp_status::file_already_exists;
    }
    auto parent = nodes_.find(parent_of(target));
    if (parent == nodes_.end() || !parent->second.directory) {
        return sftp_status::no_such_file;
    }
    if (target.compare(0, source.size() + 1, source + "/") == 0) {
        return sftp_status::failure;
    }

    // Move the node and, for directories, everything below it
    std::vector<std::pair<std::string, std::string>> moves;
    for (const auto& [path, entry] : nodes_) {
        if (path == source || path.compare(0, source.size() + 1, source + "/") == 0) {
            moves.emplace_back(path, target + path.substr(source.size()));
        }
    }
    unlink_child(source);
    for (auto& [old_path, new_path] : moves) {
        auto moved = nodes_.extract(old_path);
        moved.key() = new_path;
        nodes_.insert(std::move(moved));
    }
    link_child(target);
    return sftp_status::ok;
}

auto memory_filesystem::remove_file(const std::string& path) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto normalized = normalize(path);
    auto it = nodes_.find(normalized);
    if (it == nodes_.end()) {
        return sftp_status::no_such_file;
    }
    if (it->second.directory) {
        return sftp_status::failure;
    }
    unlink_child(normalized);
    nodes_.erase(it);
    return sftp_status::ok;
}

auto memory_filesystem::remove_directory(const std::string& path) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto normalized = normalize(path);
    auto it = nodes_.find(normalized);
    if (it == nodes_.end()) {
        return sftp_status::no_such_file;
    }
    if (!it->second.directory) {
        return sftp_status::not_a_directory;
    }
    if (normalized == "/") {
        return sftp_status::permission_denied;
    }
    if (!it->second.children.empty()) {
        return sftp_status::dir_not_empty;
    }
    unlink_child(normalized);
    nodes_.erase(it);
    return sftp_status::ok;
}

auto memory_filesystem::list(const std::string& path, std::vector<directory_entry>& entries) const
    -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto normalized = normalize(path);
    auto it = nodes_.find(normalized);
    if (it == nodes_.end()) {
        return sftp_status::no_such_file;
    }
    if (!it->second.directory) {
        return sftp_status::not_a_directory;
    }

    entries.clear();
    entries.push_back({".", attributes_of(it->second)});
    entries.push_back({"..", attributes_of(nodes_.at(parent_of(normalized)))});
    for (const auto& child : it->second.children) {
        auto child_path = normalized == "/" ? "/" + child : normalized + "/" + child;
        entries.push_back({child, attributes_of(nodes_.at(child_path))});
    }
    return sftp_status::ok;
}

auto memory_filesystem::open(const std::string& path, open_mode flags, uint32_t mode) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto normalized = normalize(path);
    auto it = nodes_.find(normalized);
    if (it != nodes_.end()) {
        if (it->second.directory) {
            return sftp_status::failure;
        }
        if (has_flag(flags, open_mode::truncate)) {
            it->second.content.clear();
            it->second.modified_time = now_seconds();
        }
        return sftp_status::ok;
    }

    if (!has_flag(flags, open_mode::create)) {
        return sftp_status::no_such_file;
    }
    auto parent = nodes_.find(parent_of(normalized));
    if (parent == nodes_.end() || !parent->second.directory) {
        return sftp_status::no_such_file;
    }

    node entry;
    entry.permissions = mode;
    entry.modified_time = now_seconds();
    nodes_.emplace(normalized, std::move(entry));
    link_child(normalized);
    return sftp_status::ok;
}

auto memory_filesystem::read_at(const std::string& path, uint64_t offset,
                                std::span<std::byte> buffer, std::size_t& count) const -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.directory) {
        return sftp_status::no_such_file;
    }
    const auto& content = it->second.content;
    if (offset >= content.size()) {
        count = 0;
        return sftp_status::ok;
    }
    count = std::min<std::size_t>(buffer.size(), content.size() - offset);
    std::copy_n(content.begin() + static_cast<std::ptrdiff_t>(offset), count, buffer.begin());
    return sftp_status::ok;
}

auto memory_filesystem::write_at(const std::string& path, uint64_t offset,
                                 std::span<const std::byte> data) -> int64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.directory) {
        return sftp_status::no_such_file;
    }
    auto& content = it->second.content;
    if (content.size() < offset + data.size()) {
        content.resize(offset + data.size());
    }
    std::copy(data.begin(), data.end(), content.begin() + static_cast<std::ptrdiff_t>(offset));
    it->second.modified_time = now_seconds();
    return sftp_status::ok;
}

void memory_filesystem::link_child(const std::string& path) {
    auto parent = nodes_.find(parent_of(path));
    if (parent != nodes_.end()) {
        parent->second.children.push_back(name_of(path));
    }
}

void memory_filesystem::unlink_child(const std::string& path) {
    auto parent = nodes_.find(parent_of(path));
    if (parent == nodes_.end()) {
        return;
    }
    auto& children = parent->second.children;
    children.erase(std::remove(children.begin(), children.end(), name_of(path)), children.end());
}

// ============================================================================
// memory_operation
// ============================================================================

auto to_string(memory_operation operation) -> std::string_view {
    switch (operation) {
        case memory_operation::open_socket: return "open_socket";
        case memory_operation::init_session: return "init_session";
        case memory_operation::handshake: return "handshake";
        case memory_operation::authenticate: return "authenticate";
        case memory_operation::init_sftp: return "init_sftp";
        case memory_operation::stat: return "stat";
        case memory_operation::mkdir: return "mkdir";
        case memory_operation::rename: return "rename";
        case memory_operation::unlink: return "unlink";
        case memory_operation::rmdir: return "rmdir";
        case memory_operation::open_directory: return "open_directory";
        case memory_operation::read_directory: return "read_directory";
        case memory_operation::close_directory: return "close_directory";
        case memory_operation::open_file: return "open_file";
        case memory_operation::read_file: return "read_file";
        case memory_operation::write_file: return "write_file";
        case memory_operation::fstat_file: return "fstat_file";
        case memory_operation::close_file: return "close_file";
    }
    return "unknown";
}

// ============================================================================
// memory_session::state
// ============================================================================

struct memory_session::state {
    struct injected_failure {
        std::size_t remaining_successes;
        native_error failure;
    };

    static constexpr std::size_t operation_count =
        static_cast<std::size_t>(memory_operation::close_file) + 1;

    std::shared_ptr<memory_filesystem> filesystem;
    memory_session_options options;

    mutable std::mutex mutex;
    std::multimap<memory_operation, injected_failure> failures;
    call_hook hook;

    std::array<std::atomic<std::size_t>, operation_count> calls{};
    std::atomic<std::size_t> active_calls{0};
    std::atomic<std::size_t> max_active_calls{0};
    std::atomic<std::size_t> handles{0};

    std::atomic<bool> socket_open{false};
    std::atomic<bool> session_open{false};
    std::atomic<bool> handshaken{false};
    std::atomic<bool> authenticated{false};
    std::atomic<bool> sftp_open{false};
    std::atomic<std::size_t> socket_released{0};
    std::atomic<std::size_t> session_released{0};
    std::atomic<std::size_t> sftp_released{0};

    /**
     * @brief Bookkeeping for one primitive call
     *
     * Counts the call as active for its lifetime, runs the hook and picks up
     * an injected failure if one is due.
     */
    class call_scope {
    public:
        call_scope(state& owner, memory_operation operation) : owner_(owner) {
            owner_.calls[static_cast<std::size_t>(operation)].fetch_add(1);
            auto active = owner_.active_calls.fetch_add(1) + 1;
            auto observed = owner_.max_active_calls.load();
            while (active > observed &&
                   !owner_.max_active_calls.compare_exchange_weak(observed, active)) {
            }

            call_hook hook;
            {
                std::lock_guard<std::mutex> lock(owner_.mutex);
                hook = owner_.hook;
            }
            if (hook) {
                hook(operation);
            }
            failure_ = owner_.take_failure(operation);
        }

        ~call_scope() { owner_.active_calls.fetch_sub(1); }

        call_scope(const call_scope&) = delete;
        auto operator=(const call_scope&) -> call_scope& = delete;

        [[nodiscard]] auto failed() const -> bool { return failure_.has_value(); }
        [[nodiscard]] auto failure() const -> native_unexpected { return native_unexpected{*failure_}; }

    private:
        state& owner_;
        std::optional<native_error> failure_;
    };

    auto take_failure(memory_operation operation) -> std::optional<native_error> {
        std::lock_guard<std::mutex> lock(mutex);
        auto [first, last] = failures.equal_range(operation);
        for (auto it = first; it != last; ++it) {
            if (it->second.remaining_successes > 0) {
                --it->second.remaining_successes;
                continue;
            }
            auto failure = std::move(it->second.failure);
            failures.erase(it);
            return failure;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto require_sftp() const -> native_result<void> {
        if (!sftp_open.load()) {
            return native_unexpected{
                native_error{native_origin::session, -39, "SFTP channel is not open"}};
        }
        return {};
    }
};

namespace {

auto check_status(int64_t status, const std::string& path) -> native_result<void> {
    if (status != sftp_status::ok) {
        return native_unexpected{sftp_failure(status, path)};
    }
    return {};
}

using session_state = memory_session::state;

// ============================================================================
// Handles
// ============================================================================

class memory_file : public remote_file {
public:
    memory_file(std::shared_ptr<session_state> owner, std::string path, bool readable,
                bool writable)
        : owner_(std::move(owner)),
          path_(std::move(path)),
          readable_(readable),
          writable_(writable) {
        owner_->handles.fetch_add(1);
    }

    ~memory_file() override {
        if (!closed_) {
            owner_->handles.fetch_sub(1);
        }
    }

    auto read(std::span<std::byte> buffer) -> native_result<std::size_t> override {
        session_state::call_scope scope(*owner_, memory_operation::read_file);
        if (scope.failed()) {
            return scope.failure();
        }
        if (closed_ || !readable_) {
            return native_unexpected{sftp_failure(sftp_status::permission_denied, path_)};
        }
        std::size_t count = 0;
        auto status = owner_->filesystem->read_at(path_, offset_, buffer, count);
        if (status != sftp_status::ok) {
            return native_unexpected{sftp_failure(status, path_)};
        }
        offset_ += count;
        return count;
    }

    auto write(std::span<const std::byte> data) -> native_result<std::size_t> override {
        session_state::call_scope scope(*owner_, memory_operation::write_file);
        if (scope.failed()) {
            return scope.failure();
        }
        if (closed_ || !writable_) {
            return native_unexpected{sftp_failure(sftp_status::permission_denied, path_)};
        }
        auto limit = owner_->options.max_write_size;
        if (limit > 0 && data.size() > limit) {
            data = data.first(limit);
        }
        auto status = owner_->filesystem->write_at(path_, offset_, data);
        if (status != sftp_status::ok) {
            return native_unexpected{sftp_failure(status, path_)};
        }
        offset_ += data.size();
        return data.size();
    }

    auto fstat() -> native_result<remote_attributes> override {
        session_state::call_scope scope(*owner_, memory_operation::fstat_file);
        if (scope.failed()) {
            return scope.failure();
        }
        auto attrs = owner_->filesystem->stat(path_);
        if (!attrs) {
            return native_unexpected{sftp_failure(sftp_status::no_such_file, path_)};
        }
        return *attrs;
    }

    auto close() -> native_result<void> override {
        if (closed_) {
            return {};
        }
        session_state::call_scope scope(*owner_, memory_operation::close_file);
        closed_ = true;
        owner_->handles.fetch_sub(1);
        if (scope.failed()) {
            return scope.failure();
        }
        return {};
    }

private:
    std::shared_ptr<session_state> owner_;
    std::string path_;
    bool readable_;
    bool writable_;
    uint64_t offset_{0};
    bool closed_{false};
};

class memory_directory : public remote_directory {
public:
    memory_directory(std::shared_ptr<session_state> owner, std::vector<directory_entry> entries)
        : owner_(std::move(owner)), entries_(std::move(entries)) {
        owner_->handles.fetch_add(1);
    }

    ~memory_directory() override {
        if (!closed_) {
            owner_->handles.fetch_sub(1);
        }
    }

    auto read_entry() -> native_result<std::optional<directory_entry>> override {
        session_state::call_scope scope(*owner_, memory_operation::read_directory);
        if (scope.failed()) {
            return scope.failure();
        }
        if (next_ >= entries_.size()) {
            return std::optional<directory_entry>{};
        }
        return std::optional<directory_entry>{entries_[next_++]};
    }

    auto close() -> native_result<void> override {
        if (closed_) {
            return {};
        }
        session_state::call_scope scope(*owner_, memory_operation::close_directory);
        closed_ = true;
        owner_->handles.fetch_sub(1);
        if (scope.failed()) {
            return scope.failure();
        }
        return {};
    }

private:
    std::shared_ptr<session_state> owner_;
    std::vector<directory_entry> entries_;
    std::size_t next_{0};
    bool closed_{false};
};

}  // namespace

// ============================================================================
// memory_session
// ============================================================================

memory_session::memory_session(std::shared_ptr<memory_filesystem> filesystem,
                               memory_session_options options)
    : state_(std::make_shared<state>()) {
    state_->filesystem =
        filesystem ? std::move(filesystem) : std::make_shared<memory_filesystem>();
    state_->options = std::move(options);
}

memory_session::~memory_session() {
    release_sftp();
    release_session();
    release_socket();
}

auto memory_session::default_failure(memory_operation operation) -> native_error {
    switch (operation) {
        case memory_operation::open_socket:
            return native_error{native_origin::system, ECONNREFUSED,
                                std::generic_category().message(ECONNREFUSED)};
        case memory_operation::init_session:
            return native_error{native_origin::session, -6, "Unable to allocate session"};
        case memory_operation::handshake:
            return native_error{native_origin::session, -5, "Unable to exchange encryption keys"};
        case memory_operation::authenticate:
            return native_error{native_origin::session, -18,
                                "Authentication failed (username/password)"};
        case memory_operation::init_sftp:
            return native_error{native_origin::session, -21, "Channel open failure"};
        case memory_operation::read_file:
        case memory_operation::write_file:
            return native_error{native_origin::session, -7, "Unable to send data on socket"};
        default:
            return sftp_failure(sftp_status::failure, "Injected failure");
    }
}

auto memory_session::open_socket(const std::string& host, uint16_t /*port*/,
                                 std::chrono::milliseconds /*timeout*/) -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::open_socket);
    if (scope.failed()) {
        return scope.failure();
    }
    if (host.empty()) {
        return native_unexpected{native_error{native_origin::system, EINVAL, "Empty host name"}};
    }
    state_->socket_open = true;
    return {};
}

auto memory_session::init_session() -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::init_session);
    if (scope.failed()) {
        return scope.failure();
    }
    if (!state_->socket_open) {
        return native_unexpected{native_error{native_origin::session, -39, "Socket is not open"}};
    }
    state_->session_open = true;
    return {};
}

auto memory_session::handshake() -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::handshake);
    if (scope.failed()) {
        return scope.failure();
    }
    if (!state_->session_open) {
        return native_unexpected{native_error{native_origin::session, -39, "Session is not open"}};
    }
    state_->handshaken = true;
    return {};
}

auto memory_session::authenticate(const std::string& username, const std::string& password)
    -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::authenticate);
    if (scope.failed()) {
        return scope.failure();
    }
    if (!state_->handshaken) {
        return native_unexpected{native_error{native_origin::session, -39, "Handshake not done"}};
    }
    if (username != state_->options.username || password != state_->options.password) {
        return native_unexpected{default_failure(memory_operation::authenticate)};
    }
    state_->authenticated = true;
    return {};
}

auto memory_session::init_sftp() -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::init_sftp);
    if (scope.failed()) {
        return scope.failure();
    }
    if (!state_->authenticated) {
        return native_unexpected{
            native_error{native_origin::session, -39, "Session is not authenticated"}};
    }
    state_->sftp_open = true;
    return {};
}

void memory_session::release_sftp() noexcept {
    if (state_->sftp_open.exchange(false)) {
        state_->sftp_released.fetch_add(1);
    }
}

void memory_session::release_session() noexcept {
    state_->handshaken = false;
    state_->authenticated = false;
    if (state_->session_open.exchange(false)) {
        state_->session_released.fetch_add(1);
    }
}

void memory_session::release_socket() noexcept {
    if (state_->socket_open.exchange(false)) {
        state_->socket_released.fetch_add(1);
    }
}

auto memory_session::stat(const std::string& path) -> native_result<remote_attributes> {
    state::call_scope scope(*state_, memory_operation::stat);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return native_unexpected{ready.error()};
    }
    auto attrs = state_->filesystem->stat(path);
    if (!attrs) {
        return native_unexpected{sftp_failure(sftp_status::no_such_file, path)};
    }
    return *attrs;
}

auto memory_session::mkdir(const std::string& path, uint32_t mode) -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::mkdir);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return ready;
    }
    return check_status(state_->filesystem->make_directory(path, mode), path);
}

auto memory_session::rename(const std::string& from, const std::string& to)
    -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::rename);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return ready;
    }
    return check_status(state_->filesystem->rename(from, to), from + " -> " + to);
}

auto memory_session::unlink(const std::string& path) -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::unlink);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return ready;
    }
    return check_status(state_->filesystem->remove_file(path), path);
}

auto memory_session::rmdir(const std::string& path) -> native_result<void> {
    state::call_scope scope(*state_, memory_operation::rmdir);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return ready;
    }
    return check_status(state_->filesystem->remove_directory(path), path);
}

auto memory_session::open_directory(const std::string& path)
    -> native_result<std::unique_ptr<remote_directory>> {
    state::call_scope scope(*state_, memory_operation::open_directory);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return native_unexpected{ready.error()};
    }
    std::vector<directory_entry> entries;
    auto status = state_->filesystem->list(path, entries);
    if (status != sftp_status::ok) {
        return native_unexpected{sftp_failure(status, path)};
    }
    std::unique_ptr<remote_directory> directory =
        std::make_unique<memory_directory>(state_, std::move(entries));
    return directory;
}

auto memory_session::open_file(const std::string& path, open_mode flags, uint32_t mode)
    -> native_result<std::unique_ptr<remote_file>> {
    state::call_scope scope(*state_, memory_operation::open_file);
    if (scope.failed()) {
        return scope.failure();
    }
    if (auto ready = state_->require_sftp(); !ready) {
        return native_unexpected{ready.error()};
    }
    auto status = state_->filesystem->open(path, flags, mode);
    if (status != sftp_status::ok) {
        return native_unexpected{sftp_failure(status, path)};
    }
    std::unique_ptr<remote_file> file = std::make_unique<memory_file>(
        state_, memory_filesystem::normalize(path), has_flag(flags, open_mode::read),
        has_flag(flags, open_mode::write));
    return file;
}

void memory_session::inject_failure(memory_operation operation, std::size_t successful_calls,
                                    std::optional<native_error> failure) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->failures.emplace(
        operation,
        state::injected_failure{successful_calls,
                                failure ? std::move(*failure) : default_failure(operation)});
}

void memory_session::clear_failures() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->failures.clear();
}

void memory_session::set_call_hook(call_hook hook) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->hook = std::move(hook);
}

auto memory_session::call_count(memory_operation operation) const -> std::size_t {
    return state_->calls[static_cast<std::size_t>(operation)].load();
}

auto memory_session::max_concurrent_calls() const -> std::size_t {
    return state_->max_active_calls.load();
}

auto memory_session::open_handles() const -> std::size_t {
    return state_->handles.load();
}

auto memory_session::is_socket_open() const -> bool {
    return state_->socket_open.load();
}

auto memory_session::is_session_open() const -> bool {
    return state_->session_open.load();
}

auto memory_session::is_sftp_open() const -> bool {
    return state_->sftp_open.load();
}

auto memory_session::socket_releases() const -> std::size_t {
    return state_->socket_released.load();
}

auto memory_session::session_releases() const -> std::size_t {
    return state_->session_released.load();
}

auto memory_session::sftp_releases() const -> std::size_t {
    return state_->sftp_released.load();
}

auto memory_session::filesystem() const -> std::shared_ptr<memory_filesystem> {
    return state_->filesystem;
}

}  // namespace async_sftp
