
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
 * File metrics reporter.
 */

#ifndef DRUNKARDMOB_FILE_REPORTER
#define DRUNKARDMOB_FILE_REPORTER

#include <cstdio>
#include <string>

#include "metrics/metrics.hpp"
#include "util/drunkardmob_errors.hpp"

namespace drunkardmob {
    
    class file_reporter : public imetrics_reporter {
    private:
        std::string filename;
        
    public:
        
        file_reporter(std::string fname) : filename(fname) {}
        
        virtual ~file_reporter() {}
        
        virtual void do_report(std::string name, std::string ident, std::map<std::string, metrics_entry> & entries) {
            FILE * f = fopen(filename.c_str(), "w");
            if (f == NULL) {
                throw configuration_error("Could not open metrics file " + filename);
            }
            if (ident != name && ident != "") {
                fprintf(f, "[%s:%s]\n", name.c_str(), ident.c_str());
            } else {
                fprintf(f, "[%s]\n", name.c_str());
            }
            const char * prefix = (ident != "" ? ident.c_str() : name.c_str());
            std::map<std::string, metrics_entry>::iterator it;
            
            for(it = entries.begin(); it != entries.end(); ++it) {
                metrics_entry &ent = it->second;
                switch(ent.valtype) {
                    case INTEGER:
                        fprintf(f, "%s.%s=%ld\n", prefix, it->first.c_str(), (long int) (ent.value));
                        fprintf(f, "%s.%s.count=%lu\n", prefix, it->first.c_str(), (unsigned long) ent.count);
                        fprintf(f, "%s.%s.min=%ld\n", prefix, it->first.c_str(), (long int) (ent.minvalue));
                        fprintf(f, "%s.%s.max=%ld\n", prefix, it->first.c_str(), (long int) (ent.maxvalue));
                        break;
                    case REAL:
                    case TIME:
                        fprintf(f, "%s.%s=%lf\n", prefix, it->first.c_str(),  (ent.value));
                        fprintf(f, "%s.%s.count=%lu\n", prefix, it->first.c_str(), (unsigned long) ent.count);
                        fprintf(f, "%s.%s.min=%lf\n", prefix, it->first.c_str(),  (ent.minvalue));
                        fprintf(f, "%s.%s.max=%lf\n", prefix, it->first.c_str(),  (ent.maxvalue));
                        if (ent.count > 0)
                            fprintf(f, "%s.%s.avg=%lf\n", prefix, it->first.c_str(), ent.cumvalue/ent.count);
                        break;
                    case STRING:
                        fprintf(f, "%s.%s=%s\n", prefix, it->first.c_str(), ent.stringval.c_str());
                        break;
                }
            }
            
            fflush(f);        
            fclose(f);
        };
        
    };
    
}



#endif

