// NatHelper.cpp - привилегированный помощник: hotspot-nat-helper <apply|remove|check> <hotspot-if> <uplink-if>
// Запускается через pkexec, живёт одну операцию, результат - код выхода.

#include "Core/Helper/NatActions.hpp"
#include "Core/Helper/NatRules.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <net/if.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <nftables/libnftables.h>

namespace
{
    class NftContext
    {
    public:
        NftContext()
        {
            ctx_ = nft_ctx_new(NFT_CTX_DEFAULT);
            if (!ctx_) throw std::runtime_error("libnftables: nft_ctx_new failed");
            nft_ctx_buffer_output(ctx_);
            nft_ctx_buffer_error(ctx_);
        }
        ~NftContext() { if (ctx_) nft_ctx_free(ctx_); }

        NftContext(const NftContext&)            = delete;
        NftContext& operator=(const NftContext&) = delete;

        // Выполнить скрипт одной транзакцией. false - ошибка, текст в LastError().
        bool Run(const std::string &commands)
        {
            const int rc = nft_run_cmd_from_buffer(ctx_, commands.c_str());
            const char *out = nft_ctx_get_output_buffer(ctx_);
            const char *err = nft_ctx_get_error_buffer(ctx_);
            output_ = out ? out : "";
            error_  = err ? err : "";
            if (rc != 0)
            {
                LOGD("nathelper") << "nft rc=" << rc << " err=" << error_;
                return false;
            }
            return true;
        }

        const std::string &LastOutput() const { return output_; }
        const std::string &LastError() const { return error_; }

    private:
        nft_ctx    *ctx_ = nullptr;
        std::string output_;
        std::string error_;
    };

    constexpr const char *kForwardPath = "/proc/sys/net/ipv4/ip_forward";
    constexpr const char *kStateDir    = "/run/hotspot-forge";
    constexpr const char *kSavedPath   = "/run/hotspot-forge/ip_forward.saved";

    std::optional<std::string> ReadSmallFile(const char *path)
    {
        int fd = ::open(path, O_RDONLY | O_CLOEXEC);
        if (fd < 0) return std::nullopt;

        char buf[16];
        ssize_t n;
        do
        {
            n = ::read(fd, buf, sizeof(buf));
        } while (n < 0 && errno == EINTR);
        ::close(fd);
        if (n <= 0) return std::nullopt;

        std::string v(buf, static_cast<std::size_t>(n));
        while (!v.empty() && (v.back() == '\n' || v.back() == ' ')) v.pop_back();
        if (v.empty()) return std::nullopt;
        return v;
    }

    bool WriteSmallFile(const char *path, const std::string &val, int flags, mode_t mode)
    {
        int fd = ::open(path, O_WRONLY | O_CLOEXEC | flags, mode);
        if (fd < 0)
        {
            LOGW("nathelper") << "open failed path=" << path << " errno=" << errno;
            return false;
        }
        const ssize_t need = static_cast<ssize_t>(val.size());
        const ssize_t n    = ::write(fd, val.data(), val.size());
        ::close(fd);
        return n == need;
    }

    // libnftables, ядро и /run
    class HostSystem : public NatActions::System
    {
    public:
        bool Run(const std::string &commands) override { return nft_.Run(commands); }
        const std::string &LastOutput() const override { return nft_.LastOutput(); }
        const std::string &LastError() const override { return nft_.LastError(); }

        bool InterfaceExists(const std::string &name) override
        {
            return ::if_nametoindex(name.c_str()) != 0;
        }

        std::optional<std::string> ReadForwarding() override
        {
            return ReadSmallFile(kForwardPath);
        }

        bool WriteForwarding(const std::string &value) override
        {
            return WriteSmallFile(kForwardPath, value, 0, 0);
        }

        std::optional<std::string> LoadSavedForwarding() override
        {
            return ReadSmallFile(kSavedPath);
        }

        bool SaveForwarding(const std::string &value) override
        {
            if (::mkdir(kStateDir, 0700) != 0 && errno != EEXIST)
            {
                LOGW("nathelper") << "mkdir " << kStateDir << " failed errno=" << errno;
                return false;
            }
            return WriteSmallFile(kSavedPath, value + "\n", O_CREAT | O_TRUNC, 0600);
        }

        void ClearSavedForwarding() override
        {
            if (::unlink(kSavedPath) != 0 && errno != ENOENT)
            {
                LOGW("nathelper") << "unlink " << kSavedPath << " failed errno=" << errno;
            }
        }

    private:
        NftContext nft_;
    };
}

int main(int argc, char **argv)
{
    Logger::Options log_opts;
    log_opts.app_name             = "hotspot-nat-helper";
    log_opts.to_file              = false;
    log_opts.console_min_severity = boost::log::trivial::info;
    Logger::Guard lg(log_opts);

    if (argc != 4)
    {
        std::cerr << "usage: hotspot-nat-helper <apply|remove|check> <hotspot-if> <uplink-if>" << std::endl;
        return NatRules::kExitUsage;
    }

    const std::optional<NatRules::Action> action = NatRules::ParseAction(argv[1]);
    if (!action)
    {
        LOGE("nathelper") << "unknown action '" << argv[1] << "'";
        return NatRules::kExitUsage;
    }

    const NatRules::InstalledPair pair{argv[2], argv[3]};
    if (!NatRules::IsValidIfName(pair.hotspot_if) || !NatRules::IsValidIfName(pair.uplink_if)
        || pair.hotspot_if == pair.uplink_if)
    {
        LOGE("nathelper") << "invalid interface pair";
        return NatRules::kExitInvalidInterface;
    }

    try
    {
        HostSystem sys;
        return NatActions::Execute(*action, sys, pair, std::cout);
    }
    catch (const std::exception &e)
    {
        LOGE("nathelper") << e.what();
        return NatRules::kExitNftUnavailable;
    }
}
