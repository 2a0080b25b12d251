/**
 * @file main.cpp
 * @brief bitflash CLI — upload a bitstream/firmware image to a device over serial.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and layer them over an optional JSON config file.
 *  - Load the image, open the port, run one Transmitter::upload().
 *  - Print a one-line `key=value` summary (or JSON with --format json).
 *
 * Exit codes:
 *   0 ok, 1 open/load failure, 2 usage/config error, 3 timeout,
 *   4 transport error, 5 NAK in --strict mode.
 *
 * Example:
 *   bitflash --dev /dev/ttyACM0 --file top.bin --address 0x03
 */

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "bitflash/config.hpp"
#include "bitflash/file_loader.hpp"
#include "bitflash/log.hpp"
#include "bitflash/transfer_protocol.hpp"
#include "bitflash/transmitter.hpp"
#include "bitflash/transport/transport_linux_serial.hpp"

using json = nlohmann::json;
using namespace bitflash;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::string hex32(uint32_t v) {
  std::ostringstream os;
  os << "0x" << std::hex << v;
  return os.str();
}

// ---------- main ----------

int main(int argc, char** argv) {
  FlasherConfig cli_cfg;

  std::string opt_config;
  std::string opt_save_config;
  std::string opt_file;
  std::string opt_address;
  std::string opt_format = "pretty";   // pretty|json
  bool opt_verbose = false;
  bool opt_quiet = false;
  bool opt_strict = false;
  bool opt_no_color = false;

  CLI::App app{"bitflash: upload a bitstream image over a serial link"};

  app.add_option("--config", opt_config, "JSON config file (CLI flags override it)");
  app.add_option("--save-config", opt_save_config, "Write the effective config to a file and exit");
  app.add_option("--file", opt_file, "Bitstream/firmware image to upload");

  CLI::Option* o_dev     = app.add_option("--dev", cli_cfg.dev, "Serial device (e.g. /dev/serial/by-id/...)");
  CLI::Option* o_address = app.add_option("--address", opt_address, "Target address on the device (decimal or 0x-hex)");
  CLI::Option* o_baud    = app.add_option("--baud", cli_cfg.baud, "Baud rate (default 115200)");
  CLI::Option* o_boot    = app.add_option("--boot-delay", cli_cfg.boot_delay_ms, "Delay after open (ms) to let USB reset");
  CLI::Option* o_timeout = app.add_option("--timeout", cli_cfg.read_timeout_ms, "Per-byte read timeout in ms (-1 waits forever)");
  CLI::Option* o_strict  = app.add_flag("--strict", opt_strict, "Abort the upload on the first NAK");

  app.add_option("--format", opt_format, "Report format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_flag("-v,--verbose", opt_verbose, "Debug logging (hex dumps of every frame)");
  app.add_flag("-q,--quiet", opt_quiet, "Only log errors");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  CLI11_PARSE(app, argc, argv);

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";

  // -------- config layering: defaults -> file -> explicit flags --------
  FlasherConfig base;
  if (!opt_config.empty()) {
    std::string err;
    if (!load_config(opt_config, base, err)) {
      std::cerr << "status=error reason=" << err << "\n";
      return 2;
    }
  }
  if (o_address->count()) {
    auto addr = parse_address(opt_address);
    if (!addr) {
      std::cerr << "status=error reason=bad_address value=" << opt_address << "\n";
      return 2;
    }
    cli_cfg.address = *addr;
  }
  cli_cfg.strict = opt_strict;

  ExplicitFields given;
  given.dev = o_dev->count() > 0;
  given.baud = o_baud->count() > 0;
  given.boot_delay_ms = o_boot->count() > 0;
  given.read_timeout_ms = o_timeout->count() > 0;
  given.address = o_address->count() > 0;
  given.strict = o_strict->count() > 0;
  const FlasherConfig cfg = layer_config(base, cli_cfg, given);

  if (!opt_save_config.empty()) {
    std::string err;
    if (!save_config(opt_save_config, cfg, err)) {
      std::cerr << "status=error reason=" << err << "\n";
      return 2;
    }
    std::cout << "status=ok saved=" << opt_save_config << "\n";
    return 0;
  }

  if (opt_file.empty()) {
    std::cerr << "status=error reason=need_file\n";
    return 2;
  }

  Log log(std::cerr, opt_verbose ? LogLevel::Debug : (opt_quiet ? LogLevel::Error : LogLevel::Info));

  // -------- load the image --------
  std::string lerr;
  auto data = load_file(opt_file, &lerr);
  if (!data) {
    std::cerr << "status=error reason=load_failed why=" << lerr << " file=" << opt_file << "\n";
    return 1;
  }

  // -------- open the port (closed by LinuxSerial's destructor on every path) --------
  transport::LinuxSerial port;
  transport::SerialConfig sc;
  sc.path = cfg.dev;
  sc.baud = cfg.baud;
  sc.boot_delay_ms = cfg.boot_delay_ms;
  sc.read_timeout_ms = cfg.read_timeout_ms;
  if (!port.open(sc)) {
    std::cerr << "status=error reason=open_failed dev=" << cfg.dev << "\n";
    return 1;
  }

  log.info("starting transmission, sending " + opt_file + " (" + std::to_string(data->size()) + " bytes)");

  TransferProtocol protocol(port, log);
  TransmitterOptions topts;
  topts.strict = cfg.strict;
  Transmitter tx(protocol, topts, log);
  UploadReport rep = tx.upload(*data, cfg.address);

  // -------- report --------
  if (opt_format == "json") {
    json j;
    j["status"] = to_string(rep.status);
    j["dev"] = cfg.dev;
    j["file"] = opt_file;
    j["address"] = cfg.address;
    j["mode"] = to_string(rep.mode);
    j["packet_count"] = rep.packet_count;
    j["packets_sent"] = rep.packets_sent;
    j["bytes_sent"] = rep.bytes_sent;
    j["naks"] = rep.naks;
    std::cout << j.dump(2) << "\n";
  } else {
    std::string status = std::string("status=") + to_string(rep.status);
    std::cout << (rep.ok() ? ansi.bold(status) : ansi.red(status))
              << " address=" << hex32(cfg.address)
              << " packets=" << rep.packet_count
              << " sent=" << rep.packets_sent
              << " bytes=" << rep.bytes_sent
              << " naks=" << rep.naks
              << " mode=" << to_string(rep.mode) << "\n";
  }

  if (rep.ok()) log.info("done.");
  return exit_code(rep.status);
}
