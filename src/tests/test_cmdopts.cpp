
/**
 * @file
 * @author  Aapo Kyrola <akyrola@cs.cmu.edu>
 * @version 1.0
 *
 * @section LICENSE
 *
 * Copyright [2012] [Aapo Kyrola, Guy Blelloch, Carlos Guestrin / Carnegie Mellon University]
 * 
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 * 
 * http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 
 *
 * @section DESCRIPTION
 *
 * Tests for command line and configuration file parsing.
 */

#include <string>
#include <map>
#include <cstdio>
#include <cstdlib>

#include "util/cmdopts.hpp"
#include "util/configfile.hpp"
#include "drunkardmob_basic_includes.hpp"
#include "tests/tests.hpp"

using namespace drunkardmob;

int test_key_value_arguments() {
    const char * argv[] = {"app", "file", "graph.txt", "--niters=7", "nsources", "12", "ntop", "3", "ntop", "4"};
    cmdopts opts(10, argv, false);
    ASSERTEQ(opts.get_option_string("file"), std::string("graph.txt"));
    ASSERTEQ(opts.get_option_int("niters", 5), 7);
    ASSERTEQ(opts.get_option_int("nsources"), 12);
    ASSERTEQ(opts.get_option_int("ntop", 10), 4);     // last occurrence wins
    ASSERTEQ(opts.get_option_int("circlesize", 300), 300);
    ASSERTCLOSE(opts.get_option_double("walks.reset_probability", 0.15), 0.15, 1e-12);
    ASSERTTRUE(!opts.has_option("companion"));
    return 0;
}

int test_missing_and_malformed() {
    const char * argv[] = {"app", "nsources", "abc", "--walks.reset_probability=x", "firstsource", "-3"};
    cmdopts opts(6, argv, false);
    ASSERTTHROWS(opts.get_option_string("file"), configuration_error);
    ASSERTTHROWS(opts.get_option_int("nsources"), configuration_error);
    ASSERTTHROWS(opts.get_option_double("walks.reset_probability", 0.15), configuration_error);
    ASSERTTHROWS(opts.get_option_long("firstsource", 0), configuration_error);
    
    const char * argv2[] = {"app", "--niters"};
    ASSERTTHROWS(cmdopts(2, argv2, false), configuration_error);
    
    /* Values that do not fit are rejected, not truncated */
    const char * argv3[] = {"app", "--nsources=4294967297", "--firstsource=4294967296", "--circlesize=4294967596",
        "ntop", "-2147483649", "niters", "2147483647"};
    cmdopts big(8, argv3, false);
    ASSERTTHROWS(big.get_option_int("nsources"), configuration_error);
    ASSERTTHROWS(big.get_option_int("circlesize", 300), configuration_error);
    ASSERTTHROWS(big.get_option_int("ntop", 10), configuration_error);
    ASSERTEQ(big.get_option_int("niters", 5), 2147483647);
    ASSERTTHROWS(pipeline_config_from_options(big), configuration_error);
    
    const char * argv4[] = {"app", "nsources", "10", "firstsource", "4294967296"};
    ASSERTTHROWS(pipeline_config_from_options(cmdopts(5, argv4, false)), configuration_error);
    const char * argv5[] = {"app", "nsources", "10", "firstsource", "4294967295"};
    ASSERTEQ(pipeline_config_from_options(cmdopts(5, argv5, false)).first_source, (vid_t) 4294967295u);
    return 0;
}

int test_config_file() {
    char fname[] = "/tmp/drunkardmob_cnfXXXXXX";
    int fd = mkstemp(fname);
    ASSERTTRUE(fd >= 0);
    FILE * f = fdopen(fd, "w");
    fprintf(f, "# comment\nniters = 9\n  ntop=2  \nbroken line\ncompanion = localhost:9100\n");
    fclose(f);
    
    std::map<std::string, std::string> conf;
    ASSERTTRUE(loadconfig("/nonexistent/drunkardmob.local.cnf", fname, conf));
    ASSERTEQ(conf.size(), (size_t) 3);
    ASSERTEQ(conf["niters"], std::string("9"));
    ASSERTEQ(conf["ntop"], std::string("2"));
    ASSERTEQ(conf["companion"], std::string("localhost:9100"));
    
    /* Command line overrides the configuration file */
    const char * argv[] = {"app", "--ntop=5"};
    cmdopts opts(2, argv, false);
    for(std::map<std::string, std::string>::iterator it = conf.begin(); it != conf.end(); ++it) {
        if (!opts.has_option(it->first)) opts.set_conf(it->first, it->second);
    }
    ASSERTEQ(opts.get_option_int("ntop", 10), 5);
    ASSERTEQ(opts.get_option_int("niters", 5), 9);
    remove(fname);
    
    std::map<std::string, std::string> none;
    ASSERTTRUE(!loadconfig("/nonexistent/a.cnf", "/nonexistent/b.cnf", none));
    return 0;
}

int test_pipeline_config() {
    const char * argv[] = {"app", "nsources", "100", "firstsource", "20", "walkspersource", "50",
        "walks.seed", "42", "execthreads", "2"};
    cmdopts opts(11, argv, false);
    pipeline_config config = pipeline_config_from_options(opts);
    ASSERTEQ(config.first_source, (vid_t) 20);
    ASSERTEQ(config.num_sources, (vid_t) 100);
    ASSERTEQ(config.walks_per_source, (size_t) 50);
    ASSERTEQ(config.niters, 5);
    ASSERTEQ(config.circle_size, 300);
    ASSERTEQ(config.salsa_iters, 4);
    ASSERTEQ(config.seed, (uint64_t) 42);
    ASSERTEQ(config.exec_threads, 2);
    ASSERTEQ(config.progress_interval, 40);
    
    const char * argv2[] = {"app", "nsources", "0"};
    ASSERTTHROWS(pipeline_config_from_options(cmdopts(3, argv2, false)), configuration_error);
    const char * argv3[] = {"app", "firstsource", "0"};
    ASSERTTHROWS(pipeline_config_from_options(cmdopts(3, argv3, false)), configuration_error);
    return 0;
}

int test_companion_address() {
    std::string host, port;
    parse_companion_address("example.org:9100", host, port);
    ASSERTEQ(host, std::string("example.org"));
    ASSERTEQ(port, std::string("9100"));
    ASSERTTHROWS(parse_companion_address("example.org", host, port), configuration_error);
    ASSERTTHROWS(parse_companion_address("example.org:", host, port), configuration_error);
    ASSERTTHROWS(parse_companion_address("example.org:99999", host, port), configuration_error);
    
    const char * argv[] = {"app", "loglevel", "verbose"};
    file_logger logger;
    ASSERTTHROWS(configure_logger(cmdopts(3, argv, false), logger), configuration_error);
    const char * argv2[] = {"app", "loglevel", "error"};
    configure_logger(cmdopts(3, argv2, false), logger);
    ASSERTEQ(logger.get_log_level(), LOG_ERROR);
    return 0;
}

int main(int argc, const char ** argv) {
    int ret = 0;
    RUN_TEST(test_key_value_arguments);
    RUN_TEST(test_missing_and_malformed);
    RUN_TEST(test_config_file);
    RUN_TEST(test_pipeline_config);
    RUN_TEST(test_companion_address);
    return ret;
}
