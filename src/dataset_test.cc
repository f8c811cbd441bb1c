#include <cmath>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backbone.h"
#include "dataset.h"
#include "dpll.h"
#include "generate.h"
#include "test.h"

TEST(generate_dataset,
     init_random(31);
     std::vector<Sample> samples;
     std::string error;
     EXPECT_TRUE(generate_dataset(4, 10, 3.0, BackboneOptions(), 0,
                                  &samples, &error));
     EXPECT_EQ(samples.size(), 4u);
     for (std::size_t i = 0; i < samples.size(); ++i) {
         const Sample& s = samples[i];
         EXPECT_EQ(s.id, static_cast<long>(i));
         EXPECT_EQ(s.nvars, 10);
         EXPECT_EQ(s.alpha, 3.0);
         EXPECT_EQ(s.clauses.size(), 30u);
         EXPECT_EQ(s.backbone_size, s.backbone.size());
         EXPECT_EQ(s.rigidity, s.backbone.size() / 10.0);
         Formula f(s.nvars, s.clauses);
         EXPECT_EQ(solve(f).result, SATISFIABLE);
         EXPECT_EQ(find_backbone(f).frozen, s.backbone);
     }
    )

// 100 random clauses over 10 variables are unsatisfiable in practice, so
// the attempt bound is reached.
TEST(max_attempts,
     init_random(32);
     std::vector<Sample> samples;
     std::string error;
     EXPECT_FALSE(generate_dataset(1, 10, 10.0, BackboneOptions(), 5,
                                   &samples, &error));
     EXPECT_TRUE(samples.empty());
     EXPECT_FALSE(error.empty());
    )

TEST(invalid_parameters,
     std::vector<Sample> samples;
     std::string error;
     EXPECT_FALSE(generate_dataset(2, 2, 3.0, BackboneOptions(), 0,
                                   &samples, &error));
     EXPECT_FALSE(error.empty());
     EXPECT_TRUE(generate_dataset(0, 10, 3.0, BackboneOptions(), 0,
                                  &samples, &error));
     EXPECT_TRUE(samples.empty());
    )

TEST(sample_json,
     Sample s;
     s.id = 7;
     s.nvars = 4;
     s.alpha = 4.26;
     s.clauses = {{1, 2}, {-1, -3, 4}};
     s.backbone[1] = true;
     s.backbone[3] = false;
     s.backbone_size = 2;
     s.rigidity = 0.5;
     nlohmann::ordered_json j = nlohmann::ordered_json::parse(to_json(s));
     EXPECT_EQ(j.size(), 7u);
     EXPECT_EQ(j.begin().key(), "id");
     EXPECT_EQ(j["id"].get<long>(), 7);
     EXPECT_EQ(j["n_vars"].get<int>(), 4);
     EXPECT_EQ(j["alpha"].get<double>(), 4.26);
     EXPECT_EQ(j["clauses"].size(), 2u);
     EXPECT_EQ(j["clauses"][1].get<std::vector<int>>(),
               (std::vector<int>{-1, -3, 4}));
     EXPECT_EQ(j["backbone"].size(), 2u);
     EXPECT_TRUE(j["backbone"]["1"].get<bool>());
     EXPECT_FALSE(j["backbone"]["3"].get<bool>());
     EXPECT_EQ(j["backbone_size"].get<std::size_t>(), 2u);
     EXPECT_EQ(j["rigidity"].get<double>(), 0.5);
    )

// An unlabeled sample still has every field, with an empty backbone object
// rather than null.
TEST(empty_sample_json,
     Sample s;
     s.nvars = 3;
     s.alpha = 1;
     nlohmann::ordered_json j = nlohmann::ordered_json::parse(to_json(s));
     EXPECT_EQ(j.size(), 7u);
     EXPECT_TRUE(j["clauses"].is_array());
     EXPECT_TRUE(j["clauses"].empty());
     EXPECT_TRUE(j["backbone"].is_object());
     EXPECT_TRUE(j["backbone"].empty());
     EXPECT_EQ(j["rigidity"].get<double>(), 0.0);
    )

TEST(dataset_json,
     EXPECT_EQ(to_json(std::vector<Sample>()), "[]\n");
     std::vector<Sample> samples(2);
     samples[1].id = 1;
     std::string one = to_json(samples[0]);
     std::string two = to_json(samples[1]);
     std::string text = to_json(samples);
     EXPECT_EQ(text, "[\n  " + one + ",\n  " + two + "\n]\n");
     nlohmann::ordered_json j = nlohmann::ordered_json::parse(text);
     EXPECT_TRUE(j.is_array());
     EXPECT_EQ(j.size(), 2u);
     EXPECT_EQ(j[1]["id"].get<long>(), 1);
    )

// A generated dataset parses back to the samples it was written from.
TEST(generated_dataset_json,
     init_random(36);
     std::vector<Sample> samples;
     std::string error;
     EXPECT_TRUE(generate_dataset(2, 8, 3.0, BackboneOptions(), 0,
                                  &samples, &error));
     nlohmann::ordered_json j =
         nlohmann::ordered_json::parse(to_json(samples));
     EXPECT_EQ(j.size(), samples.size());
     for (std::size_t i = 0; i < samples.size() && i < j.size(); ++i) {
         EXPECT_EQ(j[i]["clauses"].get<std::vector<Clause>>(),
                   samples[i].clauses);
         EXPECT_EQ(j[i]["backbone"].size(), samples[i].backbone.size());
         for (const auto& kv : samples[i].backbone) {
             EXPECT_EQ(j[i]["backbone"][std::to_string(kv.first)].get<bool>(),
                       kv.second);
         }
     }
    )

TEST(phase_sweep,
     init_random(33);
     std::vector<SweepPoint> points;
     std::string error;
     EXPECT_TRUE(phase_sweep(8, 3.0, 4.0, 0.5, 5, BackboneOptions(),
                             &points, &error));
     EXPECT_EQ(points.size(), 3u);
     for (std::size_t i = 0; i < points.size(); ++i) {
         const SweepPoint& p = points[i];
         EXPECT_TRUE(std::fabs(p.alpha - (3.0 + 0.5 * i)) < 1e-9);
         EXPECT_EQ(p.trials, 5);
         EXPECT_TRUE(p.avg_steps >= 1);
         EXPECT_TRUE(p.max_steps >= p.avg_steps);
         EXPECT_TRUE(p.sat_ratio >= 0 && p.sat_ratio <= 1);
         EXPECT_EQ(p.unknown, 0);
         EXPECT_TRUE(p.avg_rigidity >= 0 && p.avg_rigidity <= 1);
     }
    )

// 0.1 does not add up to 0.3 exactly; the last point must still be visited.
TEST(phase_sweep_inclusive_end,
     init_random(34);
     std::vector<SweepPoint> points;
     std::string error;
     EXPECT_TRUE(phase_sweep(5, 0.1, 0.3, 0.1, 1, BackboneOptions(),
                             &points, &error));
     EXPECT_EQ(points.size(), 3u);
    )

TEST(phase_sweep_budget,
     init_random(35);
     BackboneOptions opts;
     opts.max_steps = 1;
     std::vector<SweepPoint> points;
     std::string error;
     EXPECT_TRUE(phase_sweep(20, 4.0, 4.0, 1, 4, opts, &points, &error));
     EXPECT_EQ(points.size(), 1u);
     EXPECT_EQ(points[0].unknown, 4);
     EXPECT_EQ(points[0].max_steps, 1u);
    )

TEST(phase_sweep_rejects_invalid_ranges,
     std::vector<SweepPoint> points;
     std::string error;
     EXPECT_FALSE(phase_sweep(8, 3.0, 4.0, 0, 5, BackboneOptions(),
                              &points, &error));
     EXPECT_FALSE(phase_sweep(8, 4.0, 3.0, 0.5, 5, BackboneOptions(),
                              &points, &error));
     EXPECT_FALSE(phase_sweep(8, 3.0, 4.0, 0.5, 0, BackboneOptions(),
                              &points, &error));
     EXPECT_FALSE(phase_sweep(2, 3.0, 4.0, 0.5, 5, BackboneOptions(),
                              &points, &error));
     EXPECT_FALSE(error.empty());
    )

TEST(sweep_table,
     std::vector<SweepPoint> points(2);
     std::string table = sweep_table(points);
     std::size_t lines = 0;
     for (std::size_t i = 0; i < table.size(); ++i) {
         if (table[i] == '\n') {
             ++lines;
             EXPECT_TRUE(i + 1 == table.size() ||
                         table.compare(i + 1, 2, "c ") == 0);
         }
     }
     EXPECT_EQ(lines, 3u);
     EXPECT_EQ(table.compare(0, 2, "c "), 0);
    )

int main(int argc, char** argv) {
    INIT_TEST(argc, argv);
    RUN(generate_dataset);
    RUN(max_attempts);
    RUN(invalid_parameters);
    RUN(sample_json);
    RUN(empty_sample_json);
    RUN(dataset_json);
    RUN(generated_dataset_json);
    RUN(phase_sweep);
    RUN(phase_sweep_inclusive_end);
    RUN(phase_sweep_budget);
    RUN(phase_sweep_rejects_invalid_ranges);
    RUN(sweep_table);
    return test_failures > 0;
}
