#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <semaphore.h>
#include <signal.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "format_registry.h"
#include "global_cfg.h"
#include "http_server.h"
#include "version.h"

void print_help(char* argv0)
{
    fprintf(stderr, "Usage: %s [-v] [-B] [-l addr] [-p port] [-d dpi] [-D log_level]\n", argv0);
    fprintf(stderr, "  -v: Show version\n");
    fprintf(stderr, "  -B: Run as daemon\n");
    fprintf(stderr, "  -l: Set listen address (default: %s)\n", DEFAULT_LISTEN_ADDR);
    fprintf(stderr, "  -p: Set HTTP port (default: %s)\n", DEFAULT_HTTP_PORT);
    fprintf(stderr, "  -d: Set raster resolution in dpi, %d-%d (default: %d)\n", MIN_DPI, MAX_DPI, DEFAULT_DPI);
    fprintf(stderr, "  -D: Set log level, 0-8 (default: %d)\n", LOG_WARNING);
}

static sem_t signal_sem;
static int signal_num;

void signal_handler(int sig)
{
    signal_num = sig;
    sem_post(&signal_sem);
}

static bool is_number(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

int main(int argc, char** argv)
{
    server_config cfg;
    std::string dpi_arg;
    uint8_t log_level = LOG_WARNING;
    bool daemon_mode = false;
    bool show_version = false;

    int opt;
    while ((opt = getopt(argc, argv, "hvBl:p:d:D:")) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;
        case 'v':
            show_version = true;
            break;
        case 'B':
            daemon_mode = true;
            break;
        case 'l':
            cfg.listen_addr = optarg;
            break;
        case 'p':
            cfg.http_port = optarg;
            break;
        case 'd':
            dpi_arg = optarg;
            break;
        case 'D':
            log_level = atoi(optarg);
            break;
        default:
            print_help(argv[0]);
            exit(EXIT_FAILURE);
        }
    }

    if (show_version) {
        fprintf(stdout, "Build Time: %s %s\n", __DATE__, __TIME__);
        fprintf(stdout, "%s V%s\n", PROJECT_NAME, PROJECT_VERSION);
        return 0;
    }

    if (daemon_mode) {
        pid_t pid = fork();
        if (pid < 0) {
            fprintf(stderr, "Failed to fork\n");
            exit(EXIT_FAILURE);
        }
        if (pid > 0) {
            exit(EXIT_SUCCESS);
        }

        if (setsid() < 0) {
            fprintf(stderr, "Failed to setsid\n");
            exit(EXIT_FAILURE);
        }

        if (chdir("/") < 0) {
            fprintf(stderr, "Failed to chdir\n");
            exit(EXIT_FAILURE);
        }

        int fd = open("/dev/null", O_RDWR);
        if (fd >= 0) {
            dup2(fd, STDIN_FILENO);
            dup2(fd, STDOUT_FILENO);
            dup2(fd, STDERR_FILENO);
            if (fd > STDERR_FILENO)
                close(fd);
        } else {
            close(STDIN_FILENO);
            close(STDOUT_FILENO);
            close(STDERR_FILENO);
        }

        umask(0);
    }

    Logger logger(PROJECT_NAME, log_level, !daemon_mode);

    if (!is_number(cfg.http_port) || std::stoul(cfg.http_port.substr(0, 6)) > 65535) {
        LOGW("Invalid HTTP port '%s', falling back to default %s", cfg.http_port.c_str(), DEFAULT_HTTP_PORT);
        cfg.http_port = DEFAULT_HTTP_PORT;
    }

    if (!dpi_arg.empty()) {
        int dpi = is_number(dpi_arg) && dpi_arg.size() < 6 ? std::stoi(dpi_arg) : 0;
        if (dpi < MIN_DPI || dpi > MAX_DPI) {
            LOGW("Invalid dpi '%s', falling back to default %d", dpi_arg.c_str(), DEFAULT_DPI);
            dpi = DEFAULT_DPI;
        }
        cfg.dpi = dpi;
    }

    if (sem_init(&signal_sem, 0, 0) == -1) {
        perror("sem_init");
        exit(EXIT_FAILURE);
    }
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);
    signal(SIGQUIT, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    try {
        format_registry registry;
        LOGI("%s V%s, %zu formats", PROJECT_NAME, PROJECT_VERSION, registry.formats().size());

        http_server server(cfg, registry);
        if (!server.start()) {
            LOGE("Failed: server.start()");
            return EXIT_FAILURE;
        }
        while (sem_wait(&signal_sem) == -1 && errno == EINTR)
            ;
        LOGW("Received signal(%d), exiting main", signal_num);
        server.stop();
    } catch (const std::exception& e) {
        LOGE("Exception: %s", e.what());
        return EXIT_FAILURE;
    }
    LOGV("");

    return 0;
}
