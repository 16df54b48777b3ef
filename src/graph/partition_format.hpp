
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
 * Binary adjacency format of one graph partition. Note, this format
 * does not comply with standard (if there are any) formats.
 *
 *    partition_header
 *    uint64_t offsets[nvertices + 1]   (edge index of each vertex's first out-edge)
 *    vid_t    edges[numedges]
 *
 * The checksum is a zlib crc32 over the offsets and the edges. A partition
 * that fails any check is reported as graph_access_error.
 */

#ifndef DEF_DRUNKARDMOB_PARTITION_FORMAT
#define DEF_DRUNKARDMOB_PARTITION_FORMAT

#include <fcntl.h>
#include <errno.h>
#include <stdint.h>
#include <unistd.h>
#include <sstream>
#include <string>
#include <vector>

#include "drunkardmob_types.hpp"
#include "graph/memory_partition.hpp"
#include "graph/partition_filenames.hpp"
#include "util/ioutil.hpp"

namespace drunkardmob {
    
#define PARTITION_MAGIC 0x44524d42          // "DRMB"
#define PARTITION_FORMAT_VERSION 20130601   // Format version is the date it was conceived
    
    /**
     * Header struct. 32 bytes, no padding.
     */
    struct partition_header {
        uint32_t magic;
        uint32_t format_version;
        uint32_t first_vertex;
        uint32_t last_vertex;
        uint64_t numedges;
        uint32_t checksum;
        uint32_t reserved;
    };
    
    /**
     * Reads a partition file. Safe for concurrent read_neighbors() calls
     * as it uses pread only.
     */
    class partition_reader {
        std::string filename;
        int fd;
        partition_header header;
        
        partition_reader(const partition_reader&);
        partition_reader& operator=(const partition_reader&);
        
        size_t offsets_pos() const {
            return sizeof(partition_header);
        }
        
        size_t edges_pos() const {
            return sizeof(partition_header) + sizeof(uint64_t) * (num_vertices() + 1);
        }
        
        void corrupt(const std::string &what) const {
            throw graph_access_error("Corrupt partition " + filename + ": " + what);
        }
        
    public:
        partition_reader(std::string filename) : filename(filename) {
            fd = open(filename.c_str(), O_RDONLY);
            if (fd < 0) {
                throw graph_access_error(io_error_message("Could not open partition", filename));
            }
            try {
                size_t fsize = get_filesize(fd, filename);
                if (fsize < sizeof(partition_header)) corrupt("file too short");
                preada(fd, &header, sizeof(partition_header), 0, filename);
                if (header.magic != PARTITION_MAGIC) corrupt("bad magic");
                if (header.format_version != PARTITION_FORMAT_VERSION) corrupt("unsupported format version");
                if (header.last_vertex < header.first_vertex) corrupt("bad interval");
                size_t expected = edges_pos() + sizeof(vid_t) * header.numedges;
                if (fsize != expected) {
                    std::stringstream ss;
                    ss << "size " << fsize << " != expected " << expected;
                    corrupt(ss.str());
                }
            } catch (...) {
                close(fd);
                throw;
            }
        }
        
        ~partition_reader() {
            close(fd);
        }
        
        vid_t first_vertex() const {
            return header.first_vertex;
        }
        
        vid_t last_vertex() const {
            return header.last_vertex;
        }
        
        size_t num_vertices() const {
            return (size_t)(header.last_vertex - header.first_vertex) + 1;
        }
        
        uint64_t num_edges() const {
            return header.numedges;
        }
        
        /**
         * Reads and validates the offset table. The checksum is verified
         * over the whole file, so this touches every byte once.
         */
        void read_index(std::vector<uint64_t> &offsets) {
            offsets.resize(num_vertices() + 1);
            preada(fd, &offsets[0], sizeof(uint64_t) * offsets.size(), offsets_pos(), filename);
            validate_offsets(offsets);
            
            uint32_t crc = crc32_update(0, &offsets[0], sizeof(uint64_t) * offsets.size());
            const size_t chunk = 1024 * 1024;
            std::vector<vid_t> buf;
            for(uint64_t e = 0; e < header.numedges; e += chunk) {
                size_t n = (size_t) std::min((uint64_t) chunk, header.numedges - e);
                buf.resize(n);
                preada(fd, &buf[0], sizeof(vid_t) * n, edges_pos() + sizeof(vid_t) * e, filename);
                crc = crc32_update(crc, &buf[0], sizeof(vid_t) * n);
            }
            if (crc != header.checksum) corrupt("checksum mismatch");
        }
        
        /**
         * Loads the whole partition.
         */
        memory_partition * load() {
            std::vector<uint64_t> offsets(num_vertices() + 1);
            std::vector<vid_t> edges((size_t) header.numedges);
            preada(fd, &offsets[0], sizeof(uint64_t) * offsets.size(), offsets_pos(), filename);
            validate_offsets(offsets);
            if (!edges.empty()) {
                preada(fd, &edges[0], sizeof(vid_t) * edges.size(), edges_pos(), filename);
            }
            uint32_t crc = crc32_update(0, &offsets[0], sizeof(uint64_t) * offsets.size());
            if (!edges.empty()) crc = crc32_update(crc, &edges[0], sizeof(vid_t) * edges.size());
            if (crc != header.checksum) corrupt("checksum mismatch");
            return new memory_partition(header.first_vertex, header.last_vertex, offsets, edges);
        }
        
        /**
         * Reads neighbors of v using an index previously read with read_index().
         */
        void read_neighbors(vid_t v, const std::vector<uint64_t> &offsets, std::vector<vid_t> &out) {
            size_t i = v - header.first_vertex;
            size_t n = (size_t) (offsets[i + 1] - offsets[i]);
            out.resize(n);
            if (n > 0) {
                preada(fd, &out[0], sizeof(vid_t) * n, edges_pos() + sizeof(vid_t) * offsets[i], filename);
            }
        }
        
    private:
        void validate_offsets(const std::vector<uint64_t> &offsets) const {
            if (offsets[0] != 0 || offsets[offsets.size() - 1] != header.numedges) corrupt("bad offset table");
            for(size_t i = 1; i < offsets.size(); i++) {
                if (offsets[i] < offsets[i - 1]) corrupt("offsets not monotone");
            }
        }
    };
    
    
    /**
     * Writes a partition file. Edges must be added in non-decreasing
     * order of the source vertex; vertices of the interval without edges
     * get out-degree zero.
     */
    class partition_writer {
        
        std::string filename;
        partition_header header;
        std::vector<uint64_t> offsets;
        std::vector<vid_t> edges;
        vid_t lastid;
        bool finished;
        
    public:
        partition_writer(std::string filename, vid_t first_vertex, vid_t last_vertex)
            : filename(filename), lastid(first_vertex), finished(false) {
            if (last_vertex < first_vertex) {
                throw graph_access_error("Invalid partition interval for " + filename);
            }
            header.magic = PARTITION_MAGIC;
            header.format_version = PARTITION_FORMAT_VERSION;
            header.first_vertex = first_vertex;
            header.last_vertex = last_vertex;
            header.numedges = 0;
            header.checksum = 0;
            header.reserved = 0;
            offsets.reserve((size_t)(last_vertex - first_vertex) + 2);
            offsets.push_back(0);
        }
        
        void add_edge(vid_t from, vid_t to) {
            if (from < lastid || from > header.last_vertex || finished) {
                std::stringstream ss;
                ss << "Edge " << from << " -> " << to << " out of order or outside partition "
                   << header.first_vertex << " - " << header.last_vertex;
                throw graph_access_error(ss.str());
            }
            /* Close offsets of the vertices before 'from' */
            while ((vid_t) (offsets.size() - 1) + header.first_vertex < from) {
                offsets.push_back(edges.size());
            }
            lastid = from;
            edges.push_back(to);
        }
        
        void finish() {
            size_t nvertices = (size_t)(header.last_vertex - header.first_vertex) + 1;
            while (offsets.size() < nvertices + 1) {
                offsets.push_back(edges.size());
            }
            header.numedges = edges.size();
            header.checksum = crc32_update(0, &offsets[0], sizeof(uint64_t) * offsets.size());
            if (!edges.empty()) header.checksum = crc32_update(header.checksum, &edges[0], sizeof(vid_t) * edges.size());
            
            int fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
            if (fd < 0) {
                throw graph_access_error(io_error_message("Could not open for writing", filename));
            }
            try {
                writea(fd, &header, sizeof(partition_header), filename);
                writea(fd, &offsets[0], sizeof(uint64_t) * offsets.size(), filename);
                if (!edges.empty()) writea(fd, &edges[0], sizeof(vid_t) * edges.size(), filename);
            } catch (...) {
                close(fd);
                throw;
            }
            close(fd);
            finished = true;
        }
    };
    
    /**
     * Splits [0, nvertices) into nparts intervals with roughly equal
     * numbers of edges.
     */
    static inline std::vector<vertex_interval> balanced_intervals(const std::vector<std::vector<vid_t> > &adjacency, int nparts) {
        size_t nvertices = adjacency.size();
        if (nparts <= 0 || (size_t) nparts > nvertices) {
            std::stringstream ss;
            ss << "Cannot split " << nvertices << " vertices into " << nparts << " partitions";
            throw configuration_error(ss.str());
        }
        size_t nedges = 0;
        for(size_t i=0; i < nvertices; i++) nedges += adjacency[i].size();
        
        std::vector<vertex_interval> intervals;
        size_t per_part = nedges / nparts + 1;
        size_t counter = 0;
        vid_t st = 0;
        for(size_t v=0; v < nvertices; v++) {
            counter += adjacency[v].size();
            size_t remaining_vertices = nvertices - v - 1;
            size_t remaining_parts = nparts - intervals.size() - 1;
            if (remaining_parts == 0) break;
            if (counter >= per_part || remaining_vertices == remaining_parts) {
                intervals.push_back(vertex_interval(st, (vid_t) v));
                st = (vid_t) v + 1;
                counter = 0;
            }
        }
        intervals.push_back(vertex_interval(st, (vid_t) (nvertices - 1)));
        return intervals;
    }
    
    /**
     * Writes the graph given as adjacency lists into nparts partition
     * files plus the intervals file.
     */
    static inline void write_partitioned_graph(std::string base_filename, const std::vector<std::vector<vid_t> > &adjacency, int nparts) {
        std::vector<vertex_interval> intervals = balanced_intervals(adjacency, nparts);
        for(int p=0; p < nparts; p++) {
            partition_writer writer(filename_partition(base_filename, p, nparts), intervals[p].first, intervals[p].second);
            for(vid_t v = intervals[p].first; v <= intervals[p].second; v++) {
                for(size_t j=0; j < adjacency[v].size(); j++) {
                    writer.add_edge(v, adjacency[v][j]);
                }
            }
            writer.finish();
        }
        write_vertex_intervals(base_filename, intervals);
    }
    
}

#endif

