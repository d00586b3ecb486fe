/*
 * Copyright (C) 2011-2014 Red Hat, Inc.
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; If not, see <http://www.gnu.org/licenses/>.
 */

#include "zvm_config.hpp"
#include "zvm_dispatch.hpp"
#include "zvm_exec.hpp"
#include "zvm_export.hpp"
#include "zvm_provision.hpp"
#include "zvm_registry.hpp"
#include "zvm_target.hpp"
#include "zvm_zfs.hpp"

#include <atomic>
#include <errno.h>
#include <fcntl.h>
#include <getopt.h>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <syslog.h>
#include <thread>
#include <unistd.h>
#include <vector>

#ifndef VERSION
#define VERSION "unknown"
#endif

#define ZVMD_URI_ENV       "ZVMD_URI"
#define ZVMD_POLL_MS       1000
#define ZVMD_LISTEN_BACKLOG 64

using namespace ZVM;

static volatile sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signum) { shutdown_requested = 1; }

/*
 * One client connection.  fd is kept open until the serving thread has
 * been joined so that shutdown() never hits a recycled descriptor, the
 * serving thread works on a dup of it.
 */
struct Connection {
    Connection(int fd) : fd(fd), done(false) {}

    int fd;
    std::thread worker;
    std::atomic<bool> done;
};

static void usage(int rc) {
    printf("Usage: %s [OPTIONS]...\n", "zvmd");
    fputs("\
Provision ZFS volumes and export them over iSCSI.\n\
\n\
Options include:\n\
  -u, --uri=URI                 configuration URI (ZVMD_URI), e.g.\n\
                                zfs+iscsi://localhost/tank/volumes?target_helper=tgtadm\n\
  -s, --socket=PATH             unix domain socket to listen on (ZVM_UDS_PATH)\n\
  -d, --debug                   log debug messages, also to stderr\n\
  -v, --version                 print version information and exit\n\
  -h, --help                    print help text\n",
          stdout);
    exit(rc);
}

static void version() {
    printf("zvmd version %s\n\n", VERSION);
    printf("License LGPLv2.1+: GNU LGPL version 2.1 or later\n");
    exit(0);
}

static void signals_setup(void) {
    struct sigaction sa;

    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, NULL);
    sigaction(SIGINT, &sa, NULL);

    sa.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &sa, NULL);
}

static void socket_dir_create(const std::string &path) {
    size_t slash = path.rfind('/');

    if (slash == std::string::npos || slash == 0) {
        return;
    }

    std::string dir = path.substr(0, slash);
    if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
        int e = errno;
        throw ZvmException(ZVM_ERR_INVALID_ARGUMENT,
                           "Unable to create " + dir + ": " + strerror(e));
    }
}

static int listen_socket(const std::string &path) {
    struct sockaddr_un addr;

    if (path.size() >= sizeof(addr.sun_path)) {
        throw ZvmException(ZVM_ERR_INVALID_ARGUMENT,
                           "Socket path too long: " + path);
    }

    socket_dir_create(path);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        int e = errno;
        throw ZvmException(ZVM_ERR_TRANSPORT_COMMUNICATION,
                           std::string("socket: ") + strerror(e));
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        int e = errno;
        ::close(fd);
        throw ZvmException(ZVM_ERR_TRANSPORT_COMMUNICATION,
                           "Unable to remove stale " + path + ": " +
                               strerror(e));
    }

    if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0 ||
        chmod(path.c_str(), 0660) != 0 ||
        listen(fd, ZVMD_LISTEN_BACKLOG) != 0) {
        int e = errno;
        ::close(fd);
        throw ZvmException(ZVM_ERR_TRANSPORT_COMMUNICATION,
                           "Unable to listen on " + path + ": " +
                               strerror(e));
    }
    return fd;
}

static void connection_run(ProvisioningApi *api, Connection *c, int fd) {
    int rc = serve_connection(*api, fd);
    if (rc != 0) {
        syslog(LOG_USER | LOG_NOTICE, "Connection %d ended with %d", c->fd,
               rc);
    }
    c->done = true;
}

static void connections_reap(
    std::vector<std::unique_ptr<Connection>> &conns, bool all) {
    std::vector<std::unique_ptr<Connection>>::iterator it = conns.begin();

    while (it != conns.end()) {
        Connection *c = it->get();

        if (all) {
            shutdown(c->fd, SHUT_RDWR);
        }
        if (all || c->done) {
            c->worker.join();
            ::close(c->fd);
            it = conns.erase(it);
        } else {
            ++it;
        }
    }
}

static void reconcile_loop(ProvisioningApi *api, uint32_t interval) {
    uint32_t waited = 0;

    while (!shutdown_requested) {
        sleep(1);
        if (++waited < interval) {
            continue;
        }
        waited = 0;

        try {
            api->reconcile();
        } catch (const ZvmException &e) {
            syslog(LOG_USER | LOG_ERR, "Periodic reconcile failed: %s",
                   e.what());
        }
    }
}

static int serve(ProvisioningApi &api, const std::string &socket_path,
                 uint32_t reconcile_interval) {
    std::vector<std::unique_ptr<Connection>> conns;
    std::thread reconciler;
    int lfd = listen_socket(socket_path);

    syslog(LOG_USER | LOG_INFO, "Listening on %s", socket_path.c_str());

    if (reconcile_interval) {
        reconciler = std::thread(reconcile_loop, &api, reconcile_interval);
    }

    while (!shutdown_requested) {
        struct pollfd pfd;
        pfd.fd = lfd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, ZVMD_POLL_MS);
        int e = errno;
        connections_reap(conns, false);

        if (rc < 0) {
            if (e == EINTR) {
                continue;
            }
            syslog(LOG_USER | LOG_ERR, "poll: %s", strerror(e));
            break;
        }
        if (rc == 0) {
            continue;
        }

        int cfd = accept4(lfd, NULL, NULL, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno != EINTR && errno != ECONNABORTED) {
                syslog(LOG_USER | LOG_ERR, "accept: %s", strerror(errno));
            }
            continue;
        }

        int sfd = fcntl(cfd, F_DUPFD_CLOEXEC, 0);
        if (sfd < 0) {
            syslog(LOG_USER | LOG_ERR, "dup: %s", strerror(errno));
            ::close(cfd);
            continue;
        }

        std::unique_ptr<Connection> c(new Connection(cfd));
        c->worker = std::thread(connection_run, &api, c.get(), sfd);
        conns.push_back(std::move(c));
    }

    syslog(LOG_USER | LOG_INFO, "Shutting down, %zu connections open",
           conns.size());

    ::close(lfd);
    unlink(socket_path.c_str());
    connections_reap(conns, true);
    if (reconciler.joinable()) {
        reconciler.join();
    }
    return 0;
}

static struct option long_options[] = {
    {"uri", required_argument, 0, 'u'},    //0
    {"socket", required_argument, 0, 's'}, //1
    {"debug", no_argument, 0, 'd'},        //2
    {"help", no_argument, 0, 'h'},         //3
    {"version", no_argument, 0, 'v'},      //4
    {0, 0, 0, 0}};

int main(int argc, char *argv[]) {
    std::string uri;
    std::string socket_path = ZVM_UDS_PATH_DEFAULT;
    bool debug = false;
    int c;

    if (getenv(ZVMD_URI_ENV)) {
        uri = getenv(ZVMD_URI_ENV);
    }
    if (getenv(ZVM_UDS_PATH_ENV)) {
        socket_path = getenv(ZVM_UDS_PATH_ENV);
    }

    while ((c = getopt_long(argc, argv, "u:s:dhv", long_options, NULL)) !=
           -1) {
        switch (c) {
        case 'u':
            uri = optarg;
            break;
        case 's':
            socket_path = optarg;
            break;
        case 'd':
            debug = true;
            break;
        case 'h':
            usage(0);
            break;
        case 'v':
            version();
            break;
        default:
            usage(1);
        }
    }

    openlog("zvmd", LOG_PID | (debug ? LOG_PERROR : 0), LOG_USER);
    setlogmask(LOG_UPTO(debug ? LOG_DEBUG : LOG_INFO));

    if (uri.empty()) {
        fprintf(stderr, "zvmd: --uri or %s is required\n", ZVMD_URI_ENV);
        return 1;
    }

    signals_setup();

    try {
        Config cfg = config_parse(uri);
        ProcessExecutor exec(cfg.commandPrefix());
        VolumeRegistry reg(cfg.db, cfg.timeout);
        ZfsBackend zfs(exec, cfg.base, cfg.zfs_cmd, cfg.timeout);
        std::unique_ptr<TargetAdmin> admin;

        if (cfg.target_helper == ZVM_TARGET_HELPER_TGTADM) {
            admin.reset(new TgtAdm(exec, cfg.timeout));
        } else {
            admin.reset(new LioAdm(exec, cfg.timeout));
        }

        ExportManager exports(reg, *admin, cfg.target_prefix, cfg.portal);
        ProvisioningApi api(reg, zfs, exports, cfg.block_size);

        syslog(LOG_USER | LOG_INFO, "Managing %s on %s via %s", cfg.base.c_str(),
               cfg.isLocal() ? "localhost" : cfg.host.c_str(),
               cfg.target_helper == ZVM_TARGET_HELPER_TGTADM ? "tgtadm"
                                                             : "targetcli");

        try {
            api.reconcile();
        } catch (const ZvmException &e) {
            syslog(LOG_USER | LOG_ERR, "Start up reconcile failed: %s",
                   e.what());
        }

        return serve(api, socket_path, cfg.reconcile_interval);
    } catch (const ZvmException &e) {
        syslog(LOG_USER | LOG_ERR, "%s (%d) %s", e.what(), e.error_code,
               e.debug.c_str());
        if (!debug) {
            fprintf(stderr, "zvmd: %s\n", e.what());
        }
        return 1;
    }
}
