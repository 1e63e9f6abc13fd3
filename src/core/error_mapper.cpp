/**
 * @file error_mapper.cpp
 * @brief Implementation of the low-level failure mapping
 */

#include "async_sftp/core/error_mapper.h"

#include <cerrno>
#include <system_error>
#include <unordered_map>

namespace async_sftp {

namespace {

// Numeric values of the libssh2 session error codes (libssh2.h)
const std::unordered_map<int64_t, std::string_view> session_error_names = {
    {0, "LIBSSH2_ERROR_NONE"},
    {-1, "LIBSSH2_ERROR_SOCKET_NONE"},
    {-2, "LIBSSH2_ERROR_BANNER_RECV"},
    {-3, "LIBSSH2_ERROR_BANNER_SEND"},
    {-4, "LIBSSH2_ERROR_INVALID_MAC"},
    {-5, "LIBSSH2_ERROR_KEX_FAILURE"},
    {-6, "LIBSSH2_ERROR_ALLOC"},
    {-7, "LIBSSH2_ERROR_SOCKET_SEND"},
    {-8, "LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE"},
    {-9, "LIBSSH2_ERROR_TIMEOUT"},
    {-10, "LIBSSH2_ERROR_HOSTKEY_INIT"},
    {-11, "LIBSSH2_ERROR_HOSTKEY_SIGN"},
    {-12, "LIBSSH2_ERROR_DECRYPT"},
    {-13, "LIBSSH2_ERROR_SOCKET_DISCONNECT"},
    {-14, "LIBSSH2_ERROR_PROTO"},
    {-15, "LIBSSH2_ERROR_PASSWORD_EXPIRED"},
    {-16, "LIBSSH2_ERROR_FILE"},
    {-17, "LIBSSH2_ERROR_METHOD_NONE"},
    {-18, "LIBSSH2_ERROR_AUTHENTICATION_FAILED"},
    {-19, "LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED"},
    {-20, "LIBSSH2_ERROR_CHANNEL_OUTOFORDER"},
    {-21, "LIBSSH2_ERROR_CHANNEL_FAILURE"},
    {-22, "LIBSSH2_ERROR_CHANNEL_REQUEST_DENIED"},
    {-23, "LIBSSH2_ERROR_CHANNEL_UNKNOWN"},
    {-24, "LIBSSH2_ERROR_CHANNEL_WINDOW_EXCEEDED"},
    {-25, "LIBSSH2_ERROR_CHANNEL_PACKET_EXCEEDED"},
    {-26, "LIBSSH2_ERROR_CHANNEL_CLOSED"},
    {-27, "LIBSSH2_ERROR_CHANNEL_EOF_SENT"},
    {-28, "LIBSSH2_ERROR_SCP_PROTOCOL"},
    {-29, "LIBSSH2_ERROR_ZLIB"},
    {-30, "LIBSSH2_ERROR_SOCKET_TIMEOUT"},
    {-31, "LIBSSH2_ERROR_SFTP_PROTOCOL"},
    {-32, "LIBSSH2_ERROR_REQUEST_DENIED"},
    {-33, "LIBSSH2_ERROR_METHOD_NOT_SUPPORTED"},
    {-34, "LIBSSH2_ERROR_INVAL"},
    {-35, "LIBSSH2_ERROR_INVALID_POLL_TYPE"},
    {-36, "LIBSSH2_ERROR_PUBLICKEY_PROTOCOL"},
    {-37, "LIBSSH2_ERROR_EAGAIN"},
    {-38, "LIBSSH2_ERROR_BUFFER_TOO_SMALL"},
    {-39, "LIBSSH2_ERROR_BAD_USE"},
    {-40, "LIBSSH2_ERROR_COMPRESS"},
    {-41, "LIBSSH2_ERROR_OUT_OF_BOUNDARY"},
    {-42, "LIBSSH2_ERROR_AGENT_PROTOCOL"},
    {-43, "LIBSSH2_ERROR_SOCKET_RECV"},
    {-44, "LIBSSH2_ERROR_ENCRYPT"},
    {-45, "LIBSSH2_ERROR_BAD_SOCKET"},
    {-46, "LIBSSH2_ERROR_KNOWN_HOSTS"},
    {-47, "LIBSSH2_ERROR_CHANNEL_WINDOW_FULL"},
    {-48, "LIBSSH2_ERROR_KEYFILE_AUTH_FAILED"},
    {-49, "LIBSSH2_ERROR_RANDGEN"},
    {-50, "LIBSSH2_ERROR_MISSING_USERAUTH_BANNER"},
    {-51, "LIBSSH2_ERROR_ALGO_UNSUPPORTED"},
    {-52, "LIBSSH2_ERROR_MAC_FAILURE"},
    {-53, "LIBSSH2_ERROR_HASH_INIT"},
    {-54, "LIBSSH2_ERROR_HASH_CALC"},
};

// SFTP status codes (draft-ietf-secsh-filexfer)
const std::unordered_map<int64_t, std::string_view> sftp_status_names = {
    {0, "SSH_FX_OK"},
    {1, "SSH_FX_EOF"},
    {2, "SSH_FX_NO_SUCH_FILE"},
    {3, "SSH_FX_PERMISSION_DENIED"},
    {4, "SSH_FX_FAILURE"},
    {5, "SSH_FX_BAD_MESSAGE"},
    {6, "SSH_FX_NO_CONNECTION"},
    {7, "SSH_FX_CONNECTION_LOST"},
    {8, "SSH_FX_OP_UNSUPPORTED"},
    {9, "SSH_FX_INVALID_HANDLE"},
    {10, "SSH_FX_NO_SUCH_PATH"},
    {11, "SSH_FX_FILE_ALREADY_EXISTS"},
    {12, "SSH_FX_WRITE_PROTECT"},
    {13, "SSH_FX_NO_MEDIA"},
    {14, "SSH_FX_NO_SPACE_ON_FILESYSTEM"},
    {15, "SSH_FX_QUOTA_EXCEEDED"},
    {16, "SSH_FX_UNKNOWN_PRINCIPAL"},
    {17, "SSH_FX_LOCK_CONFLICT"},
    {18, "SSH_FX_DIR_NOT_EMPTY"},
    {19, "SSH_FX_NOT_A_DIRECTORY"},
    {20, "SSH_FX_INVALID_FILENAME"},
    {21, "SSH_FX_LINK_LOOP"},
};

auto lookup(const std::unordered_map<int64_t, std::string_view>& table, int64_t code)
    -> std::string_view {
    auto it = table.find(code);
    return it == table.end() ? std::string_view{} : it->second;
}

}  // namespace

auto error_mapper::session_error_name(int64_t code) -> std::string_view {
    return lookup(session_error_names, code);
}

auto error_mapper::sftp_status_name(int64_t code) -> std::string_view {
    return lookup(sftp_status_names, code);
}

auto error_mapper::describe(const native_error& native) -> std::string {
    std::string text(to_string(native.origin));
    text += " error ";
    text += std::to_string(native.code);

    std::string_view name;
    switch (native.origin) {
        case native_origin::session:
            name = session_error_name(native.code);
            break;
        case native_origin::sftp:
            name = sftp_status_name(native.code);
            break;
        case native_origin::system:
        case native_origin::none:
            break;
    }
    if (!name.empty()) {
        text += " (";
        text += name;
        text += ")";
    }
    if (!native.message.empty()) {
        text += ": ";
        text += native.message;
    }
    return text;
}

auto error_mapper::map(sftp_error_code kind, native_error native) -> error {
    std::string message(to_string(kind));
    if (native) {
        message += " [";
        message += describe(native);
        message += "]";
    }
    return error{kind, std::move(message), std::move(native)};
}

auto error_mapper::map(sftp_error_code kind, const std::error_code& ec) -> error {
    return map(kind, native_error{native_origin::system, ec.value(), ec.message()});
}

auto error_mapper::make(sftp_error_code kind, std::string_view detail) -> error {
    std::string message(to_string(kind));
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return error{kind, std::move(message)};
}

auto error_mapper::from_exception(const std::exception& ex) -> error {
    return make(sftp_error_code::unknown, ex.what());
}

auto error_mapper::last_system_error() -> native_error {
    int value = errno;
    return native_error{native_origin::system, value, std::generic_category().message(value)};
}

}  // namespace async_sftp
