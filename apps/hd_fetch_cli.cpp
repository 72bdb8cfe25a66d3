// SPDX-License-Identifier: MIT
// Part of HttpDispatch (HD) project.
// apps/hd_fetch_cli.cpp

#include "hd/dispatcher.hpp"
#include "hd/http_response.hpp"
#include "hd/log.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <exception>
#include <utility>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --url URL [--url URL ...] [--method GET|POST|...] "
      "[--header \"Name: value\" ...] [--data STRING]\n"
      "\n"
      "Transport:\n"
      "  --timeout <sec>           total transfer timeout (default 10)\n"
      "  --connect_timeout <sec>   connect timeout (default 10)\n"
      "  --max_redirs <n>          redirect cap (default 10)\n"
      "  --verify 0|1              verify TLS peer and host (default 0)\n"
      "  --cookies <path>          shared cookie jar file\n"
      "\n"
      "Errors:\n"
      "  --ignore all|c1,c2,...    libcurl error codes turned into partial responses\n"
      "\n"
      "Output:\n"
      "  --body 0|1                print response bodies (default 1)\n"
      "  --log <path>              append log lines to a file\n"
      "  --quiet 0|1               do not echo log lines to stderr (default 0)\n";
}

// "all" or a comma separated list of codes.
static bool parse_ignore(const std::string& s, hd::IgnoredErrors& out){
    if (s == "all") { out = hd::IgnoredErrors::all(); return true; }
    std::set<int> codes;
    std::istringstream iss(s);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (item.empty()) continue;
        try { codes.insert(std::stoi(item)); } catch (const std::exception&) { return false; }
    }
    out = hd::IgnoredErrors(std::move(codes));
    return true;
}

// "Name: value" -> (Name, value)
static bool parse_header(const std::string& s, std::string& name, std::string& value){
    const std::size_t c = s.find(':');
    if (c == std::string::npos || c == 0) return false;
    name = s.substr(0, c);
    value = s.substr(c + 1);
    const std::size_t a = value.find_first_not_of(" \t");
    value = (a == std::string::npos) ? std::string() : value.substr(a);
    return true;
}

int main(int argc, char** argv){
    hd::Settings settings;
    std::vector<std::string> urls;
    std::vector<std::pair<std::string,std::string>> headers;
    std::string method = "GET";
    std::string data;
    bool print_body = true;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--url" && i+1<argc) urls.push_back(argv[++i]);
            else if(a=="--method" && i+1<argc) method = argv[++i];
            else if(a=="--header" && i+1<argc) {
                std::string n, v;
                if (!parse_header(argv[++i], n, v)) { usage(argv[0]); return 2; }
                headers.emplace_back(n, v);
            }
            else if(a=="--data" && i+1<argc) data = argv[++i];
            else if(a=="--timeout" && i+1<argc) settings.set(CURLOPT_TIMEOUT, std::max(1L, std::stol(argv[++i])));
            else if(a=="--connect_timeout" && i+1<argc) settings.set(CURLOPT_CONNECTTIMEOUT, std::max(1L, std::stol(argv[++i])));
            else if(a=="--max_redirs" && i+1<argc) settings.set(CURLOPT_MAXREDIRS, std::stol(argv[++i]));
            else if(a=="--verify" && i+1<argc) {
                const bool on = std::stoi(argv[++i]) != 0;
                settings.set(CURLOPT_SSL_VERIFYPEER, on ? 1L : 0L);
                settings.set(CURLOPT_SSL_VERIFYHOST, on ? 2L : 0L);
            }
            else if(a=="--cookies" && i+1<argc) settings.cookies_path = argv[++i];
            else if(a=="--ignore" && i+1<argc) {
                if (!parse_ignore(argv[++i], settings.ignored_errors)) { usage(argv[0]); return 2; }
            }
            else if(a=="--body" && i+1<argc) print_body = (std::stoi(argv[++i])!=0);
            else if(a=="--log" && i+1<argc) settings.log_file = argv[++i];
            else if(a=="--quiet" && i+1<argc) settings.log_echo = (std::stoi(argv[++i])==0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    if (urls.empty()) { usage(argv[0]); return 2; }

    std::vector<hd::Request> requests;
    requests.reserve(urls.size());
    for (const auto& u : urls) {
        hd::Request r(method, u);
        for (const auto& h : headers) r.add_header(h.first, h.second);
        r.body = data;
        requests.push_back(std::move(r));
    }

    std::vector<hd::HttpResponse> responses;
    try {
        hd::Dispatcher dispatcher(settings);
        responses = dispatcher.fetch(requests);
    } catch (const hd::TransportError& e) {
        std::cerr << "[CLI] " << e.request().uri << ": error " << e.code() << ": " << e.what() << "\n";
        return 1;
    }

    for (std::size_t i = 0; i < responses.size(); ++i) {
        const auto& resp = responses[i];
        std::cout << "== " << requests[i].uri << "\n";
        std::cout << "HTTP " << resp.status_code << " " << resp.status_text << "\n";
        for (const auto& kv : resp.headers) {
            std::cout << kv.first << ": " << kv.second << "\n";
        }
        if (print_body) {
            std::cout << "\n" << resp.body << "\n";
        }
    }
    return 0;
}
