// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "support/ScratchHost.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace BulwarkTest {

    ScratchHost::ScratchHost() {
        std::string pattern = (fs::temp_directory_path() / "bulwark_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        rootDir = buffer.data();

        const auto l = layout();
        fs::create_directories(fs::path(l.sshdConfig).parent_path());
        fs::create_directories(l.procSys);
        for (const auto& dir : l.worldWritableRoots) {
            fs::create_directories(dir);
        }
    }

    ScratchHost::~ScratchHost() {
        std::error_code ec;
        fs::remove_all(rootDir, ec);
    }

    Bulwark::Core::HostLayout ScratchHost::layout() const {
        auto l = Bulwark::Core::HostLayout::rootedAt(rootDir);
        l.criticalFileOwner = geteuid();
        return l;
    }

    void ScratchHost::write(const std::string& path, const std::string& content, mode_t mode) const {
        fs::create_directories(fs::path(path).parent_path());
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out) throw std::runtime_error("cannot write " + path);
            out << content;
        }
        if (chmod(path.c_str(), mode) != 0) {
            throw std::runtime_error("chmod failed on " + path);
        }
    }

    std::string ScratchHost::read(const std::string& path) const {
        std::ifstream in(path, std::ios::binary);
        if (!in) throw std::runtime_error("cannot read " + path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    mode_t ScratchHost::modeOf(const std::string& path) const {
        struct stat st {};
        if (stat(path.c_str(), &st) != 0) throw std::runtime_error("cannot stat " + path);
        return st.st_mode & 07777;
    }

    void ScratchHost::setSysctl(const std::string& key, const std::string& value) const {
        write(layout().procSys + "/" + BulwarkUtils::replaceAll(key, ".", "/"), value + "\n");
    }

    std::string ScratchHost::sysctl(const std::string& key) const {
        return BulwarkUtils::trim(read(layout().procSys + "/" + BulwarkUtils::replaceAll(key, ".", "/")));
    }

    std::vector<std::string> ScratchHost::backupsOf(const std::string& path) const {
        const fs::path p(path);
        const std::string prefix = p.filename().string() + ".backup.";
        std::vector<std::string> found;
        for (const auto& entry : fs::directory_iterator(p.parent_path())) {
            if (BulwarkUtils::startsWith(entry.path().filename().string(), prefix)) {
                found.push_back(entry.path().string());
            }
        }
        std::sort(found.begin(), found.end());
        return found;
    }

    void ScratchHost::populateCompliant() const {
        const auto l = layout();
        write(l.sshdConfig,
              "# hardened\n"
              "PermitRootLogin no\n"
              "PasswordAuthentication no\n"
              "X11Forwarding no\n"
              "MaxAuthTries 3\n");
        write(l.loginDefs, "PASS_MAX_DAYS\t90\nPASS_MIN_DAYS\t1\n");
        write(l.passwd,
              "root:x:0:0:root:/root:/bin/bash\n"
              "daemon:x:1:1:daemon:/usr/sbin:/usr/sbin/nologin\n"
              "alice:x:1000:1000:Alice:/home/alice:/bin/bash\n", 0644);
        write(l.shadow,
              "root:$6$salt$hash:19000:0:99999:7:::\n"
              "daemon:*:19000:0:99999:7:::\n"
              "alice:$6$salt$hash2:19000:0:90:7:::\n", 0600);
        write(l.group, "root:x:0:\nalice:x:1000:\n", 0644);
        write(l.sysctlConf, "# kernel\n");
        setSysctl("net.ipv4.ip_forward", "0");
        setSysctl("net.ipv4.conf.all.accept_redirects", "0");
        setSysctl("net.ipv4.conf.default.accept_redirects", "0");
        setSysctl("net.ipv4.conf.all.accept_source_route", "0");
        setSysctl("net.ipv4.conf.default.accept_source_route", "0");
        setSysctl("net.ipv4.tcp_syncookies", "1");
    }
}
