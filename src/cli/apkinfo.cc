#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "apk.hpp"
#include "axml.hpp"
#include "pugixml.hpp"
#include "zip.hpp"

void print_usage() {
  std::cerr
      << "usage: apkinfo [options] input.apk\n\n"
      << "Prints the metadata of an Android application package as XML.\n\n"
      << "Options:\n"
      << "  -k, --keytool PATH   Read signature digests with this keytool\n"
      << "  -t, --timeout MS     Kill keytool after MS milliseconds\n"
      << "  -i, --icon OUT       Write the launcher icon to OUT\n"
      << "  -d, --density DPI    Density used to pick the icon (default 720)\n"
      << "  -l, --locale LOCALE  Locale of the display name (en, en-rUS)\n"
      << "      --abi64 PREFIX   Entry prefix of 64-bit native code "
         "(repeatable)\n"
      << "      --abi32 PREFIX   Entry prefix of 32-bit native code "
         "(repeatable)\n"
      << "  -m, --manifest       Print the decoded AndroidManifest.xml "
         "instead\n"
      << "  -p, --pretty-print   Format the XML with proper indentation\n"
      << "  -h, --help           Show this help message\n";
}

static bool parse_number(const char *text, long max, long *out) {
  char *end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < 0 || value > max) {
    return false;
  }
  *out = value;
  return true;
}

static std::string to_string(bool value) { return value ? "true" : "false"; }

static int dump_manifest(const std::string &input_path, bool pretty_print,
                         const libapk::WarningCallback &warnings) {
  libapk::ZipArchive archive(input_path);
  const libapk::ZipEntry *entry = archive.find(libapk::kManifestEntry);
  if (!entry) {
    std::cerr << "Error: " << libapk::kManifestEntry << " not found in "
              << input_path << "\n";
    return 1;
  }
  std::vector<uint8_t> bytes = archive.read(*entry);
  libapk::ParseOptions options;
  options.warning_callback = warnings;
  libapk::XmlDocument doc =
      libapk::parseBinaryXml(bytes.data(), bytes.size(), options);
  std::cout << libapk::toXmlString(doc, pretty_print);
  return 0;
}

static void write_report(const libapk::ApkInfo &info, bool pretty_print) {
  pugi::xml_document doc;
  pugi::xml_node apk = doc.append_child("apk");
  apk.append_attribute("name") = info.name.c_str();
  apk.append_attribute("bundle_id") = info.bundle_id.c_str();
  apk.append_attribute("version") = info.version.c_str();
  apk.append_attribute("build") = static_cast<long long>(info.build);
  apk.append_attribute("size") = static_cast<unsigned long long>(info.size);
  apk.append_attribute("md5") = info.md5.c_str();
  apk.append_attribute("min_sdk") = info.min_sdk_version;
  apk.append_attribute("target_sdk") = info.target_sdk_version;

  pugi::xml_node signature = apk.append_child("signature");
  signature.append_attribute("md5") = info.signature_md5.c_str();
  signature.append_attribute("sha1") = info.signature_sha1.c_str();
  signature.append_attribute("sha256") = info.signature_sha256.c_str();

  pugi::xml_node abi = apk.append_child("abi");
  abi.append_attribute("os64") = to_string(info.support_os64).c_str();
  abi.append_attribute("os32") = to_string(info.support_os32).c_str();

  if (info.icon) {
    pugi::xml_node icon = apk.append_child("icon");
    icon.append_attribute("path") = info.icon->path.c_str();
    icon.append_attribute("width") = info.icon->image.width;
    icon.append_attribute("height") = info.icon->image.height;
  }

  for (const std::string &name : info.uses_permissions) {
    apk.append_child("uses-permission").append_attribute("name") =
        name.c_str();
  }
  for (const libapk::DeclaredPermission &permission : info.permissions) {
    pugi::xml_node node = apk.append_child("permission");
    node.append_attribute("name") = permission.name.c_str();
    node.append_attribute("protection_level") =
        permission.protection_level.c_str();
  }

  if (pretty_print) {
    doc.save(std::cout, "  ", pugi::format_default | pugi::format_indent);
  } else {
    doc.save(std::cout, "", pugi::format_raw);
    std::cout << "\n";
  }
}

int main(int argc, char *argv[]) {
  libapk::ExtractOptions options;
  bool dump = false;
  bool pretty_print = false;
  bool abi64_set = false;
  bool abi32_set = false;
  std::string icon_path;
  std::string input_path;

  auto need_value = [&](int idx) {
    if (idx + 1 >= argc) {
      std::cerr << "Error: " << argv[idx] << " requires a value\n\n";
      print_usage();
      return false;
    }
    return true;
  };

  int arg_idx = 1;
  while (arg_idx < argc) {
    const char *arg = argv[arg_idx];

    if (strcmp(arg, "-k") == 0 || strcmp(arg, "--keytool") == 0) {
      if (!need_value(arg_idx)) return 1;
      options.keytool_path = argv[arg_idx + 1];
      arg_idx += 2;
    } else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--timeout") == 0) {
      if (!need_value(arg_idx)) return 1;
      long ms = 0;
      if (!parse_number(argv[arg_idx + 1], 86400000L, &ms)) {
        std::cerr << "Error: Invalid timeout: " << argv[arg_idx + 1] << "\n";
        return 1;
      }
      options.tool_timeout = std::chrono::milliseconds(ms);
      arg_idx += 2;
    } else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--icon") == 0) {
      if (!need_value(arg_idx)) return 1;
      icon_path = argv[arg_idx + 1];
      options.decode_icon = true;
      arg_idx += 2;
    } else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--density") == 0) {
      if (!need_value(arg_idx)) return 1;
      long dpi = 0;
      if (!parse_number(argv[arg_idx + 1], 0xFFFF, &dpi)) {
        std::cerr << "Error: Invalid density: " << argv[arg_idx + 1] << "\n";
        return 1;
      }
      options.icon_density = static_cast<uint16_t>(dpi);
      arg_idx += 2;
    } else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--locale") == 0) {
      if (!need_value(arg_idx)) return 1;
      options.locale = argv[arg_idx + 1];
      arg_idx += 2;
    } else if (strcmp(arg, "--abi64") == 0) {
      if (!need_value(arg_idx)) return 1;
      if (!abi64_set) {
        options.abi64_prefixes.clear();
        abi64_set = true;
      }
      options.abi64_prefixes.push_back(argv[arg_idx + 1]);
      arg_idx += 2;
    } else if (strcmp(arg, "--abi32") == 0) {
      if (!need_value(arg_idx)) return 1;
      if (!abi32_set) {
        options.abi32_prefixes.clear();
        abi32_set = true;
      }
      options.abi32_prefixes.push_back(argv[arg_idx + 1]);
      arg_idx += 2;
    } else if (strcmp(arg, "-m") == 0 || strcmp(arg, "--manifest") == 0) {
      dump = true;
      arg_idx++;
    } else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--pretty-print") == 0) {
      pretty_print = true;
      arg_idx++;
    } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
      print_usage();
      return 0;
    } else if (arg[0] == '-' && arg[1] != '\0') {
      std::cerr << "Error: Unknown option: " << arg << "\n\n";
      print_usage();
      return 1;
    } else {
      break;
    }
  }

  if (arg_idx >= argc) {
    std::cerr << "Error: Missing input file\n\n";
    print_usage();
    return 1;
  }
  input_path = argv[arg_idx++];
  if (arg_idx < argc) {
    std::cerr << "Error: Unexpected argument: " << argv[arg_idx] << "\n\n";
    print_usage();
    return 1;
  }

  options.warning_callback = [](const std::string &category,
                                const std::string &message) {
    std::cerr << "Warning [" << category << "]: " << message << std::endl;
  };

  try {
    if (dump) {
      return dump_manifest(input_path, pretty_print, options.warning_callback);
    }

    libapk::ApkInfo info = libapk::parseApk(input_path, options);

    if (!icon_path.empty()) {
      if (!info.icon) {
        std::cerr << "Error: No icon could be decoded from " << input_path
                  << "\n";
        return 1;
      }
      std::ofstream out(icon_path, std::ios::binary);
      if (!out) {
        std::cerr << "Error: Cannot open output file: " << icon_path << "\n";
        return 1;
      }
      out.write(reinterpret_cast<const char *>(info.icon->bytes.data()),
                static_cast<std::streamsize>(info.icon->bytes.size()));
      if (!out) {
        std::cerr << "Error: Failed to write icon to " << icon_path << "\n";
        return 1;
      }
    }

    write_report(info, pretty_print);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
