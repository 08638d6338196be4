/* Copyright (c) 2003-2024 by Mike Jarvis
 *
 * GridPairs is free software: redistribution and use in source and binary forms,
 * with or without modification, are permitted provided that the following
 * conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions, and the disclaimer given in the accompanying LICENSE
 *    file.
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions, and the disclaimer given in the documentation
 *    and/or other materials provided with the distribution.
 */

#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <vector>

#include "BinType.h"
#include "Grid.h"
#include "Mesh.h"
#include "PairCounts.h"
#include "CountPairs.h"

struct Sample
{
    std::vector<double> x, y, z;

    void add(double xi, double yi, double zi)
    { x.push_back(xi); y.push_back(yi); z.push_back(zi); }

    long size() const { return long(x.size()); }
};

static Sample RandomSample(long n, double box, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> uniform(0., box);
    Sample s;
    for (long i=0; i<n; ++i) {
        const double x = uniform(rng);
        const double y = uniform(rng);
        const double z = uniform(rng);
        s.add(x, y, z);
    }
    return s;
}

static RectangularDoubleMesh* BuildMesh(const Sample& s1, const Sample& s2, double box,
                                        double search, double approx2, bool pbc)
{
    return new RectangularDoubleMesh(
        &s1.x[0], &s1.y[0], &s1.z[0], s1.size(),
        &s2.x[0], &s2.y[0], &s2.z[0], s2.size(),
        search, search, search, approx2, approx2, approx2,
        search, search, search, box, box, box, pbc);
}

static void ExpectSameCounts(const PairCounts& a, const PairCounts& b)
{
    ASSERT_EQ(a.getNBins1(), b.getNBins1());
    ASSERT_EQ(a.getNBins2(), b.getNBins2());
    for (int k=0; k<a.getNBins1(); ++k) {
        for (int g=0; g<a.getNBins2(); ++g) {
            EXPECT_EQ(a.getCount(k, g), b.getCount(k, g)) << "k = " << k << ", g = " << g;
        }
    }
}

const double s_bins[5] = { 0.5, 1.0, 2.0, 3.5, 5.0 };
const double mu_bins[4] = { 0.1, 0.3, 0.6, 1.0 };

TEST(FindBinTest, EdgesBelongToLowerBin) {
    const double bins[3] = { 0.5, 1.0, 2.0 };
    EXPECT_EQ(FindBin(0.2, bins, 3), -1);
    EXPECT_EQ(FindBin(0.5, bins, 3), -1);
    EXPECT_EQ(FindBin(0.7, bins, 3), 0);
    EXPECT_EQ(FindBin(1.0, bins, 3), 0);
    EXPECT_EQ(FindBin(1.5, bins, 3), 1);
    EXPECT_EQ(FindBin(2.0, bins, 3), 1);
    EXPECT_EQ(FindBin(0.3, bins, 1), -1);
}

TEST(BinTypeTest, SMuCoords) {
    double s, mu;
    BinTypeHelper<SMu>::calculateCoords(0., 0., 0., s, mu);
    EXPECT_EQ(s, 0.);
    EXPECT_EQ(mu, 0.);
    BinTypeHelper<SMu>::calculateCoords(3., -4., 0., s, mu);
    EXPECT_DOUBLE_EQ(s, 5.);
    EXPECT_DOUBLE_EQ(mu, 0.);
    BinTypeHelper<SMu>::calculateCoords(0., 0., -2., s, mu);
    EXPECT_DOUBLE_EQ(s, 2.);
    EXPECT_DOUBLE_EQ(mu, 1.);
}

TEST(BinTypeTest, RpPiCoords) {
    double rp, pi;
    BinTypeHelper<RpPi>::calculateCoords(3., 4., -1.5, rp, pi);
    EXPECT_DOUBLE_EQ(rp, 5.);
    EXPECT_DOUBLE_EQ(pi, 1.5);

    double xs, ys, zs;
    GetSearchLengths(RpPi, 6., 2., xs, ys, zs);
    EXPECT_EQ(xs, 6.);
    EXPECT_EQ(ys, 6.);
    EXPECT_EQ(zs, 2.);
}

TEST(PairCountsTest, SinglePairOnBinEdge) {
    Sample s1, s2;
    s1.add(0., 0., 0.);
    s2.add(0., 0., 1.);
    const double sb[3] = { 0.5, 1.0, 2.0 };
    const double mb[2] = { 0.5, 1.0 };

    RectangularDoubleMesh mesh(&s1.x[0], &s1.y[0], &s1.z[0], 1,
                               &s2.x[0], &s2.y[0], &s2.z[0], 1,
                               2., 2., 2., 2., 2., 2., 2., 2., 2., 6., 6., 6., false);
    EXPECT_EQ(mesh.getNCells1(), 27);

    PairCounts counts(SMu, sb, 3, mb, 2);
    ProcessRange(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1());
    EXPECT_EQ(counts.getCount(1, 1), 1);
    EXPECT_EQ(counts.getTotal(), 1);

    long long cum[6];
    counts.getCumulative(cum);
    const long long expected[6] = { 0, 0,
                                    0, 1,
                                    0, 1 };
    for (int i=0; i<6; ++i) EXPECT_EQ(cum[i], expected[i]);
}

TEST(PairCountsTest, CoincidentPointsHaveZeroMu) {
    Sample s;
    s.add(1., 1., 1.);
    std::vector<double> sb(2), mb(2);
    sb[0] = 0.5; sb[1] = 1.0;
    mb[0] = 0.5; mb[1] = 1.0;

    std::vector<long long> cum = CountPairs(SMu, s.x, s.y, s.z, s.x, s.y, s.z, sb, mb,
                                            0., 0., 0., false);
    ASSERT_EQ(cum.size(), 4u);
    for (int i=0; i<4; ++i) EXPECT_EQ(cum[i], 1);
}

TEST(PairCountsTest, PeriodicWrap) {
    Sample s1, s2;
    s1.add(0.5, 5., 5.);
    s2.add(9.5, 5., 5.);
    std::vector<double> sb(3), mb(2);
    sb[0] = 0.5; sb[1] = 1.5; sb[2] = 3.0;
    mb[0] = 0.5; mb[1] = 1.0;

    // Through the wrap, the pair has s = 1 and mu = 0.
    std::vector<long long> cum = CountPairs(SMu, s1.x, s1.y, s1.z, s2.x, s2.y, s2.z, sb, mb,
                                            10., 10., 10., true);
    ASSERT_EQ(cum.size(), 6u);
    EXPECT_EQ(cum[0*2+0], 0);
    EXPECT_EQ(cum[0*2+1], 0);
    EXPECT_EQ(cum[1*2+0], 1);
    EXPECT_EQ(cum[1*2+1], 1);
    EXPECT_EQ(cum[2*2+1], 1);

    // Without the wrap, s = 9 is too far to count.
    cum = CountPairs(SMu, s1.x, s1.y, s1.z, s2.x, s2.y, s2.z, sb, mb, 10., 10., 10., false);
    for (int i=0; i<6; ++i) EXPECT_EQ(cum[i], 0);
}

TEST(PairCountsTest, PeriodicWrapAlongLineOfSight) {
    Sample s1, s2;
    s1.add(5., 5., 9.8);
    s2.add(5., 5., 0.3);
    const double sb[2] = { 0.2, 1.0 };
    const double mb[2] = { 0.5, 1.0 };

    RectangularDoubleMesh mesh(&s1.x[0], &s1.y[0], &s1.z[0], 1,
                               &s2.x[0], &s2.y[0], &s2.z[0], 1,
                               2., 2., 2., 2., 2., 2., 1., 1., 1., 10., 10., 10., true);
    PairCounts counts(SMu, sb, 2, mb, 2);
    ProcessRange(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1());
    EXPECT_EQ(counts.getCount(1, 1), 1);
    EXPECT_EQ(counts.getTotal(), 1);
}

TEST(PairCountsTest, MatchesBruteForcePeriodic) {
    const double box = 20.;
    Sample s1 = RandomSample(300, box, 1234);
    Sample s2 = RandomSample(400, box, 5678);

    RectangularDoubleMesh* mesh = BuildMesh(s1, s2, box, 5., 2.5, true);
    PairCounts mesh_counts(SMu, s_bins, 5, mu_bins, 4);
    ProcessRange(mesh_counts, mesh->getDoubleMesh(), 0, mesh->getNCells1());
    delete mesh;

    PairCounts brute_counts(SMu, s_bins, 5, mu_bins, 4);
    PeriodicBox pbox(box, box, box, true);
    ProcessBrute(brute_counts, &s1.x[0], &s1.y[0], &s1.z[0], s1.size(),
                 &s2.x[0], &s2.y[0], &s2.z[0], s2.size(), pbox, false);

    EXPECT_GT(brute_counts.getTotal(), 0);
    ExpectSameCounts(mesh_counts, brute_counts);
}

TEST(PairCountsTest, MatchesBruteForceOpen) {
    const double box = 20.;
    Sample s1 = RandomSample(300, box, 4321);
    Sample s2 = RandomSample(400, box, 8765);

    RectangularDoubleMesh* mesh = BuildMesh(s1, s2, box, 5., 5., false);
    PairCounts mesh_counts(SMu, s_bins, 5, mu_bins, 4);
    ProcessRange(mesh_counts, mesh->getDoubleMesh(), 0, mesh->getNCells1());
    delete mesh;

    PairCounts brute_counts(SMu, s_bins, 5, mu_bins, 4);
    PeriodicBox pbox(box, box, box, false);
    ProcessBrute(brute_counts, &s1.x[0], &s1.y[0], &s1.z[0], s1.size(),
                 &s2.x[0], &s2.y[0], &s2.z[0], s2.size(), pbox, false);

    EXPECT_GT(brute_counts.getTotal(), 0);
    ExpectSameCounts(mesh_counts, brute_counts);
}

TEST(PairCountsTest, PeriodicCountsAtLeastOpenCounts) {
    const double box = 20.;
    Sample s1 = RandomSample(200, box, 11);
    Sample s2 = RandomSample(200, box, 12);

    RectangularDoubleMesh* periodic = BuildMesh(s1, s2, box, 5., 5., true);
    RectangularDoubleMesh* open = BuildMesh(s1, s2, box, 5., 5., false);
    PairCounts periodic_counts(SMu, s_bins, 5, mu_bins, 4);
    PairCounts open_counts(SMu, s_bins, 5, mu_bins, 4);
    ProcessRange(periodic_counts, periodic->getDoubleMesh(), 0, periodic->getNCells1());
    ProcessRange(open_counts, open->getDoubleMesh(), 0, open->getNCells1());
    delete periodic;
    delete open;

    EXPECT_GT(periodic_counts.getTotal(), open_counts.getTotal());
}

TEST(PairCountsTest, WorkRangesAreAdditive) {
    const double box = 20.;
    Sample s1 = RandomSample(200, box, 21);
    Sample s2 = RandomSample(300, box, 22);
    RectangularDoubleMesh* mesh = BuildMesh(s1, s2, box, 5., 2.5, true);
    DoubleMesh dm = mesh->getDoubleMesh();
    const long ncells = mesh->getNCells1();
    ASSERT_EQ(ncells, 64);

    PairCounts full(SMu, s_bins, 5, mu_bins, 4);
    ProcessRange(full, dm, 0, ncells);

    PairCounts part1(SMu, s_bins, 5, mu_bins, 4);
    PairCounts part2(SMu, s_bins, 5, mu_bins, 4);
    PairCounts part3(SMu, s_bins, 5, mu_bins, 4);
    ProcessRange(part1, dm, 0, 17);
    ProcessRange(part2, dm, 17, 17);
    ProcessRange(part3, dm, 17, ncells);
    EXPECT_EQ(part2.getTotal(), 0);

    part1 += part2;
    part1 += part3;
    ExpectSameCounts(full, part1);
    delete mesh;
}

TEST(PairCountsTest, ParallelMatchesSerial) {
    const double box = 20.;
    Sample s1 = RandomSample(300, box, 31);
    Sample s2 = RandomSample(300, box, 32);
    RectangularDoubleMesh* mesh = BuildMesh(s1, s2, box, 5., 2.5, true);

    PairCounts serial(SMu, s_bins, 5, mu_bins, 4);
    ProcessRange(serial, mesh->getDoubleMesh(), 0, mesh->getNCells1());

    const int old_num_threads = GetOMPThreads();
    SetOMPThreads(4);
    PairCounts parallel(SMu, s_bins, 5, mu_bins, 4);
    Process(parallel, mesh->getDoubleMesh(), 0, mesh->getNCells1(), false);
    SetOMPThreads(old_num_threads);
    delete mesh;

    ExpectSameCounts(serial, parallel);
}

TEST(PairCountsTest, CallerBufferIsNotCleared) {
    Sample s1, s2;
    s1.add(0., 0., 0.);
    s2.add(0., 0., 1.);
    const double sb[3] = { 0.5, 1.0, 2.0 };
    const double mb[2] = { 0.5, 1.0 };
    RectangularDoubleMesh mesh(&s1.x[0], &s1.y[0], &s1.z[0], 1,
                               &s2.x[0], &s2.y[0], &s2.z[0], 1,
                               2., 2., 2., 2., 2., 2., 2., 2., 2., 6., 6., 6., false);

    long long buffer[6] = { 1, 1, 1, 1, 1, 1 };
    PairCounts counts(SMu, sb, 3, mb, 2, buffer);
    ProcessRange(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1());
    ProcessRange(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1());
    EXPECT_EQ(buffer[1*2+1], 3);
    EXPECT_EQ(counts.getTotal(), 8);

    counts.clear();
    for (int i=0; i<6; ++i) EXPECT_EQ(buffer[i], 0);
}

TEST(PairCountsTest, RpPiBinning) {
    Sample s1, s2;
    s1.add(0., 0., 0.);
    s2.add(3., 4., 1.);
    std::vector<double> rp_bins(2), pi_bins(2);
    rp_bins[0] = 1.; rp_bins[1] = 6.;
    pi_bins[0] = 0.5; pi_bins[1] = 2.;

    std::vector<long long> cum = CountPairs(RpPi, s1.x, s1.y, s1.z, s2.x, s2.y, s2.z,
                                            rp_bins, pi_bins, 0., 0., 0., false);
    ASSERT_EQ(cum.size(), 4u);
    EXPECT_EQ(cum[0], 0);
    EXPECT_EQ(cum[1], 0);
    EXPECT_EQ(cum[2], 0);
    EXPECT_EQ(cum[3], 1);
}

TEST(PairCountsTest, RadialBinning) {
    Sample s1, s2;
    s1.add(0., 0., 0.);
    s2.add(1., 0., 0.);
    s2.add(0., 2., 0.);
    s2.add(0., 0., 5.);
    std::vector<double> r_bins(3), zero(1, 0.);
    r_bins[0] = 0.5; r_bins[1] = 1.5; r_bins[2] = 3.;

    std::vector<long long> cum = CountPairs(Radial, s1.x, s1.y, s1.z, s2.x, s2.y, s2.z,
                                            r_bins, zero, 0., 0., 0., false);
    ASSERT_EQ(cum.size(), 3u);
    EXPECT_EQ(cum[0], 0);
    EXPECT_EQ(cum[1], 1);
    EXPECT_EQ(cum[2], 2);
}

TEST(CountPairsTest, MatchesCumulativeBruteForce) {
    const double box = 20.;
    Sample s1 = RandomSample(250, box, 41);
    Sample s2 = RandomSample(250, box, 42);
    std::vector<double> sb(s_bins, s_bins+5);
    std::vector<double> mb(mu_bins, mu_bins+4);

    std::vector<long long> cum = CountPairs(SMu, s1.x, s1.y, s1.z, s2.x, s2.y, s2.z, sb, mb,
                                            box, box, box, true, 0., 2.5, 2);

    PairCounts brute(SMu, s_bins, 5, mu_bins, 4);
    PeriodicBox pbox(box, box, box, true);
    ProcessBrute(brute, &s1.x[0], &s1.y[0], &s1.z[0], s1.size(),
                 &s2.x[0], &s2.y[0], &s2.z[0], s2.size(), pbox, false);
    std::vector<long long> expected(20);
    brute.getCumulative(&expected[0]);

    ASSERT_EQ(cum.size(), 20u);
    for (int i=0; i<20; ++i) EXPECT_EQ(cum[i], expected[i]) << "i = " << i;

    // Cumulative counts never decrease along either axis.
    for (int k=0; k<5; ++k) {
        for (int g=0; g<4; ++g) {
            if (k > 0) EXPECT_GE(cum[k*4+g], cum[(k-1)*4+g]);
            if (g > 0) EXPECT_GE(cum[k*4+g], cum[k*4+g-1]);
        }
    }
}

TEST(CountPairsTest, RejectsBadInput) {
    Sample s;
    s.add(1., 1., 1.);
    std::vector<double> sb(2), mb(2), short_x(2, 1.);
    sb[0] = 0.5; sb[1] = 1.0;
    mb[0] = 0.5; mb[1] = 1.0;

    EXPECT_THROW(CountPairs(SMu, short_x, s.y, s.z, s.x, s.y, s.z, sb, mb, 10., 10., 10., true),
                 std::invalid_argument);
    // Search length larger than a third of the box.
    EXPECT_THROW(CountPairs(SMu, s.x, s.y, s.z, s.x, s.y, s.z, sb, mb, 2., 2., 2., true),
                 std::invalid_argument);
    std::vector<double> empty;
    EXPECT_THROW(CountPairs(SMu, s.x, s.y, s.z, s.x, s.y, s.z, empty, mb, 10., 10., 10., true),
                 std::invalid_argument);
}

TEST(PairCountsTest, RejectsBadBins) {
    const double descending[3] = { 2.0, 1.0, 3.0 };
    const double ascending[2] = { 0.5, 1.0 };
    const double negative_mu[2] = { -0.5, 1.0 };
    const double nonzero[1] = { 0.5 };
    EXPECT_THROW(PairCounts(SMu, descending, 3, ascending, 2), std::invalid_argument);
    EXPECT_THROW(PairCounts(SMu, ascending, 2, descending, 3), std::invalid_argument);
    EXPECT_THROW(PairCounts(SMu, ascending, 2, negative_mu, 2), std::invalid_argument);
    EXPECT_THROW(PairCounts(Radial, ascending, 2, nonzero, 1), std::invalid_argument);
    EXPECT_THROW(PairCounts(SMu, ascending, 0, ascending, 2), std::invalid_argument);
}

TEST(PairCountsTest, RejectsBadRangeOrMesh) {
    Sample s;
    s.add(1., 1., 1.);
    RectangularDoubleMesh mesh(&s.x[0], &s.y[0], &s.z[0], 1, &s.x[0], &s.y[0], &s.z[0], 1,
                               2., 2., 2., 2., 2., 2., 2., 2., 2., 6., 6., 6., true);
    DoubleMesh dm = mesh.getDoubleMesh();

    const double sb[2] = { 0.5, 1.0 };
    const double mb[2] = { 0.5, 1.0 };
    PairCounts counts(SMu, sb, 2, mb, 2);
    EXPECT_THROW(ProcessRange(counts, dm, 0, 28), std::invalid_argument);
    EXPECT_THROW(ProcessRange(counts, dm, 5, 4), std::invalid_argument);
    EXPECT_THROW(ProcessRange(counts, dm, -1, 4), std::invalid_argument);
    EXPECT_NO_THROW(ProcessRange(counts, dm, 27, 27));
    EXPECT_EQ(counts.getTotal(), 0);

    // The mesh only searches out to 2, but the bins go to 3.
    const double far_bins[2] = { 1.0, 3.0 };
    PairCounts far(SMu, far_bins, 2, mb, 2);
    EXPECT_THROW(ProcessRange(far, dm, 0, 27), std::invalid_argument);
    EXPECT_THROW(Process(far, dm, 0, 27, false), std::invalid_argument);
}

static void ExpectMeshMatchesBrute(BinType bin_type,
                                   const double* bins1, int nbins1,
                                   const double* bins2, int nbins2,
                                   const Sample& s1, const Sample& s2, double box,
                                   double xsearch, double ysearch, double zsearch,
                                   double approx2, bool pbc)
{
    RectangularDoubleMesh mesh(&s1.x[0], &s1.y[0], &s1.z[0], s1.size(),
                               &s2.x[0], &s2.y[0], &s2.z[0], s2.size(),
                               xsearch, ysearch, zsearch, approx2, approx2, approx2,
                               xsearch, ysearch, zsearch, box, box, box, pbc);
    PairCounts mesh_counts(bin_type, bins1, nbins1, bins2, nbins2);
    ProcessRange(mesh_counts, mesh.getDoubleMesh(), 0, mesh.getNCells1());

    PairCounts brute_counts(bin_type, bins1, nbins1, bins2, nbins2);
    PeriodicBox pbox(box, box, box, pbc);
    ProcessBrute(brute_counts, &s1.x[0], &s1.y[0], &s1.z[0], s1.size(),
                 &s2.x[0], &s2.y[0], &s2.z[0], s2.size(), pbox, false);

    EXPECT_GT(brute_counts.getTotal(), 0);
    ExpectSameCounts(mesh_counts, brute_counts);
}

TEST(PairCountsTest, SelfPairsMatchBruteForce) {
    const double box = 20.;
    Sample s = RandomSample(400, box, 51);
    ExpectMeshMatchesBrute(SMu, s_bins, 5, mu_bins, 4, s, s, box, 5., 5., 5., 2.5, true);
    ExpectMeshMatchesBrute(SMu, s_bins, 5, mu_bins, 4, s, s, box, 5., 5., 5., 5., false);

    // Every point is paired with itself once, at s = 0 and mu = 0.
    RectangularDoubleMesh mesh(&s.x[0], &s.y[0], &s.z[0], s.size(),
                               &s.x[0], &s.y[0], &s.z[0], s.size(),
                               5., 5., 5., 5., 5., 5., 5., 5., 5., box, box, box, true);
    const double tiny_bins[2] = { 1.e-12, 1.0 };
    const double all_mu[1] = { 1.0 };
    PairCounts counts(SMu, tiny_bins, 2, all_mu, 1);
    ProcessRange(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1());
    EXPECT_EQ(counts.getCount(0, 0), s.size());
}

TEST(PairCountsTest, RpPiMatchesBruteForce) {
    const double box = 20.;
    Sample s1 = RandomSample(300, box, 61);
    Sample s2 = RandomSample(300, box, 62);
    const double rp_bins[4] = { 0.5, 1.5, 3.0, 4.0 };
    const double pi_bins[3] = { 0.5, 1.0, 2.0 };

    // The search along the line of sight is shorter than across it.
    ExpectMeshMatchesBrute(RpPi, rp_bins, 4, pi_bins, 3, s1, s2, box, 4., 4., 2., 2.5, true);
    ExpectMeshMatchesBrute(RpPi, rp_bins, 4, pi_bins, 3, s1, s2, box, 4., 4., 2., 2.5, false);
    ExpectMeshMatchesBrute(RpPi, rp_bins, 4, pi_bins, 3, s1, s1, box, 4., 4., 2., 2.5, true);
}

TEST(PairCountsTest, RadialMatchesBruteForce) {
    const double box = 20.;
    Sample s1 = RandomSample(300, box, 71);
    Sample s2 = RandomSample(300, box, 72);
    const double zero[1] = { 0. };

    ExpectMeshMatchesBrute(Radial, s_bins, 5, zero, 1, s1, s2, box, 5., 5., 5., 2.5, true);
    ExpectMeshMatchesBrute(Radial, s_bins, 5, zero, 1, s1, s2, box, 5., 5., 5., 5., false);
    ExpectMeshMatchesBrute(Radial, s_bins, 5, zero, 1, s1, s1, box, 5., 5., 5., 2.5, true);
}

TEST(PairCountsTest, LatticeOnBinEdgesMatchesBruteForce) {
    // Lattice separations land exactly on the bin edges, including through the wrap.
    const double h = 1.1;
    const int n = 12;
    const double box = n * h;
    Sample s;
    for (int i=0; i<n; ++i)
        for (int j=0; j<n; ++j)
            for (int k=0; k<n; ++k)
                s.add(i*h, j*h, k*h);
    const double lattice_bins[3] = { h, 2*h, 3*h };
    const double lattice_mu[2] = { 0.5, 1.0 };

    ExpectMeshMatchesBrute(SMu, lattice_bins, 3, lattice_mu, 2, s, s, box,
                           3*h, 3*h, 3*h, 3*h, true);
}

TEST(PairCountsTest, BruteForceRejectsPointsOutsidePeriodicBox) {
    Sample s1, s2;
    s1.add(1., 1., 1.);
    s2.add(1., 11., 1.);
    const double sb[2] = { 0.5, 1.0 };
    const double mb[2] = { 0.5, 1.0 };
    PairCounts counts(SMu, sb, 2, mb, 2);
    PeriodicBox pbox(10., 10., 10., true);
    EXPECT_THROW(ProcessBrute(counts, &s1.x[0], &s1.y[0], &s1.z[0], 1,
                              &s2.x[0], &s2.y[0], &s2.z[0], 1, pbox, false),
                 std::invalid_argument);

    PeriodicBox open(10., 10., 10., false);
    EXPECT_NO_THROW(ProcessBrute(counts, &s1.x[0], &s1.y[0], &s1.z[0], 1,
                                 &s2.x[0], &s2.y[0], &s2.z[0], 1, open, false));
}
