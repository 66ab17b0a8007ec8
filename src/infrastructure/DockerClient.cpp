#include "infrastructure/DockerClient.hpp"
#include <httplib.h>
#include <sys/socket.h>
#include <cctype>
#include <initializer_list>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace dockbuild::infrastructure {

using json = nlohmann::json;

namespace {

constexpr int kShortTimeoutSeconds = 30;
constexpr int kExecSettlePolls = 50;
constexpr auto kExecSettleInterval = std::chrono::milliseconds(100);

std::unique_ptr<httplib::Client> OpenClient(const DockerEndpoint& endpoint, int readTimeoutSeconds) {
    std::unique_ptr<httplib::Client> cli;
    if (endpoint.usesUnixSocket()) {
        cli = std::make_unique<httplib::Client>(endpoint.socketPath, 80);
        cli->set_address_family(AF_UNIX);
        // The daemon rejects a socket path as Host header.
        cli->set_default_headers({{"Host", "localhost"}});
    } else {
        cli = std::make_unique<httplib::Client>(endpoint.host, endpoint.port);
    }
    cli->set_connection_timeout(kShortTimeoutSeconds);
    cli->set_read_timeout(readTimeoutSeconds);
    cli->set_write_timeout(readTimeoutSeconds);
    return cli;
}

std::string UrlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

// Daemon errors come as {"message": "..."}; fall back to the raw body.
std::string ErrorDetail(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    } catch (const json::exception&) {
    }
    return body;
}

template <typename Result>
void Expect(const Result& res, const std::string& operation, std::initializer_list<int> accepted) {
    if (!res) {
        throw DockerError(operation, 0, "connection failed (httplib error " +
                                            std::to_string(static_cast<int>(res.error())) + ")");
    }
    for (int status : accepted) {
        if (res->status == status) return;
    }
    throw DockerError(operation, res->status, ErrorDetail(res->body));
}

std::string IdFromBody(const std::string& body, const std::string& operation) {
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("Id") && parsed["Id"].is_string()) {
            return parsed["Id"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw DockerError(operation, 0, std::string("malformed response: ") + e.what());
    }
    throw DockerError(operation, 0, "response carries no Id");
}

} // namespace

std::string DockerEndpoint::describe() const {
    if (usesUnixSocket()) return "unix://" + socketPath;
    return "tcp://" + host + ":" + std::to_string(port);
}

DockerError::DockerError(const std::string& operation, int status, const std::string& detail)
    : std::runtime_error("Docker " + operation + " failed" +
                         (status ? " (HTTP " + std::to_string(status) + ")" : std::string()) +
                         ": " + detail),
      m_status(status) {}

DockerClient::DockerClient(DockerEndpoint endpoint)
    : m_endpoint(std::move(endpoint)) {}

std::string DockerClient::apiPath(const std::string& path) const {
    if (m_endpoint.apiVersion.empty()) return path;
    return "/" + m_endpoint.apiVersion + path;
}

bool DockerClient::ping() {
    auto cli = OpenClient(m_endpoint, 5);
    auto res = cli->Get("/_ping");
    if (res && res->status == 200) {
        return true;
    }
    if (res) {
        std::cerr << "[DockerClient] Ping HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[DockerClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return false;
}

bool DockerClient::imageExists(const std::string& imageReference) {
    auto cli = OpenClient(m_endpoint, kShortTimeoutSeconds);
    auto res = cli->Get(apiPath("/images/" + imageReference + "/json"));
    if (res && res->status == 404) {
        return false;
    }
    Expect(res, "inspect image " + imageReference, {200});
    return true;
}

void DockerClient::pullImage(const std::string& imageReference) {
    auto [name, tag] = SplitImageReference(imageReference);
    std::string query = "?fromImage=" + UrlEncode(name);
    if (!tag.empty()) {
        query += "&tag=" + UrlEncode(tag);
    }

    std::cout << "[DockerClient] Pulling image: " << imageReference << std::endl;
    auto cli = OpenClient(m_endpoint, m_endpoint.readTimeoutSeconds);
    auto res = cli->Post(apiPath("/images/create" + query), std::string(), "text/plain");
    Expect(res, "pull image " + imageReference, {200});

    // Progress is newline-delimited JSON; failures arrive in-band with HTTP 200.
    std::istringstream lines(res->body);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) continue;
        try {
            auto event = json::parse(line);
            if (event.contains("error")) {
                std::string detail = event["error"].is_string()
                    ? event["error"].get<std::string>()
                    : event["error"].dump();
                throw DockerError("pull image " + imageReference, 0, detail);
            }
        } catch (const json::exception&) {
            // Not every progress line is complete JSON.
        }
    }
    std::cout << "[DockerClient] Pulled image: " << imageReference << std::endl;
}

std::string DockerClient::createContainer(const json& config) {
    auto cli = OpenClient(m_endpoint, kShortTimeoutSeconds);
    auto res = cli->Post(apiPath("/containers/create"), config.dump(), "application/json");
    Expect(res, "create container", {201});
    return IdFromBody(res->body, "create container");
}

void DockerClient::startContainer(const std::string& containerId) {
    auto cli = OpenClient(m_endpoint, kShortTimeoutSeconds);
    auto res = cli->Post(apiPath("/containers/" + containerId + "/start"), std::string(), "text/plain");
    Expect(res, "start container " + containerId, {204, 304});
}

void DockerClient::putArchive(const std::string& containerId, const std::string& path, const std::string& tarBytes) {
    auto cli = OpenClient(m_endpoint, m_endpoint.readTimeoutSeconds);
    auto res = cli->Put(apiPath("/containers/" + containerId + "/archive?path=" + UrlEncode(path)),
                        tarBytes, "application/x-tar");
    Expect(res, "copy into container " + containerId, {200});
}

std::string DockerClient::createExec(const std::string& containerId, const std::vector<std::string>& argv) {
    json request = {
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"Cmd", argv}
    };

    auto cli = OpenClient(m_endpoint, kShortTimeoutSeconds);
    auto res = cli->Post(apiPath("/containers/" + containerId + "/exec"), request.dump(), "application/json");
    Expect(res, "create exec in " + containerId, {201});
    return IdFromBody(res->body, "create exec");
}

std::string DockerClient::startExec(const std::string& execId) {
    json request = {
        {"Detach", false},
        {"Tty", false}
    };

    auto cli = OpenClient(m_endpoint, m_endpoint.readTimeoutSeconds);
    auto res = cli->Post(apiPath("/exec/" + execId + "/start"), request.dump(), "application/json");
    Expect(res, "start exec " + execId, {200});
    return res->body;
}

int DockerClient::inspectExecExitCode(const std::string& execId) {
    auto cli = OpenClient(m_endpoint, kShortTimeoutSeconds);

    // The stream can close a moment before the daemon records the exit.
    for (int attempt = 0; attempt < kExecSettlePolls; ++attempt) {
        auto res = cli->Get(apiPath("/exec/" + execId + "/json"));
        Expect(res, "inspect exec " + execId, {200});

        json body;
        try {
            body = json::parse(res->body);
        } catch (const json::exception& e) {
            throw DockerError("inspect exec " + execId, 0, std::string("malformed response: ") + e.what());
        }

        bool running = body.value("Running", false);
        if (!running && body.contains("ExitCode") && body["ExitCode"].is_number_integer()) {
            return body["ExitCode"].get<int>();
        }
        std::this_thread::sleep_for(kExecSettleInterval);
    }
    throw DockerError("inspect exec " + execId, 0, "exec did not report an exit code");
}

bool DockerClient::removeContainer(const std::string& containerId) {
    auto cli = OpenClient(m_endpoint, kShortTimeoutSeconds);
    auto res = cli->Delete(apiPath("/containers/" + containerId + "?force=true&v=true"));
    if (!res) {
        std::cerr << "[DockerClient] Connection failed removing " << containerId << ": "
                  << static_cast<int>(res.error()) << std::endl;
        return false;
    }
    if (res->status == 204 || res->status == 404) {
        return true;
    }
    std::cerr << "[DockerClient] HTTP Error " << res->status << " removing " << containerId
              << ": " << ErrorDetail(res->body) << std::endl;
    return false;
}

std::pair<std::string, std::string> DockerClient::SplitImageReference(const std::string& imageReference) {
    if (imageReference.find('@') != std::string::npos) {
        return {imageReference, ""};
    }
    auto colon = imageReference.rfind(':');
    auto slash = imageReference.rfind('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {imageReference.substr(0, colon), imageReference.substr(colon + 1)};
    }
    return {imageReference, "latest"};
}

} // namespace dockbuild::infrastructure
