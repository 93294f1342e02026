// register file: bank renaming and the write port budget

#include "RegFile.h"

#include <gtest/gtest.h>

TEST(RegFileTest, HalvesShareAPair)
{
    RegFile rf;
    rf.beginPhase();
    rf.write16(RegFile::RP_BC, 0x1234);
    EXPECT_EQ(rf.read8(RegFile::R8_B), 0x12);
    EXPECT_EQ(rf.read8(RegFile::R8_C), 0x34);

    rf.beginPhase();
    rf.write8(RegFile::R8_A, 0x5A);
    rf.write8(RegFile::R8_F, 0xC3);
    EXPECT_EQ(rf.read16(RegFile::RP_AF), 0x5AC3);
    EXPECT_FALSE(rf.portOverrun());
}


TEST(RegFileTest, PairMapping)
{
    EXPECT_EQ(RegFile::pairOf(RegFile::R8_IXL), RegFile::RP_IX);
    EXPECT_FALSE(RegFile::isHigh(RegFile::R8_IXL));
    EXPECT_EQ(RegFile::pairOf(RegFile::R8_A), RegFile::RP_AF);
    EXPECT_TRUE(RegFile::isHigh(RegFile::R8_A));
    EXPECT_FALSE(RegFile::isHigh(RegFile::R8_F));
    EXPECT_EQ(RegFile::highOf(RegFile::RP_WZ), RegFile::R8_W);
    EXPECT_EQ(RegFile::lowOf(RegFile::RP_IR), RegFile::R8_R);

    for (int r=0; r < RegFile::NUM_R8; r++) {
        const RegFile::reg8_t r8 = static_cast<RegFile::reg8_t>(r);
        const RegFile::rp_t rp = RegFile::pairOf(r8);
        EXPECT_EQ((RegFile::isHigh(r8)) ? RegFile::highOf(rp) : RegFile::lowOf(rp), r8);
    }
}


TEST(RegFileTest, TwoByteWritesFitOnePhase)
{
    RegFile rf;
    rf.beginPhase();
    rf.write8(RegFile::R8_B, 1);
    rf.write8(RegFile::R8_E, 2);
    EXPECT_FALSE(rf.portOverrun());
    rf.write8(RegFile::R8_L, 3);
    EXPECT_TRUE(rf.portOverrun());

    // sticky until cleared
    rf.beginPhase();
    EXPECT_TRUE(rf.portOverrun());
    rf.clearFault();
    EXPECT_FALSE(rf.portOverrun());
}


TEST(RegFileTest, WordPlusByteOverruns)
{
    RegFile rf;
    rf.beginPhase();
    rf.write16(RegFile::RP_SP, 0x8000);
    EXPECT_FALSE(rf.portOverrun());
    rf.write8(RegFile::R8_F, 0x00);
    EXPECT_TRUE(rf.portOverrun());
}


TEST(RegFileTest, DebugPortIsNotBudgeted)
{
    RegFile rf;
    rf.beginPhase();
    for (int i=0; i < 8; i++) {
        rf.poke(RegFile::RP_HL, static_cast<uint16>(i));
    }
    EXPECT_FALSE(rf.portOverrun());
    EXPECT_EQ(rf.peek(RegFile::RP_HL), 7);
}


TEST(RegFileTest, ExchangeAfRenames)
{
    RegFile rf;
    rf.poke(RegFile::RP_AF, 0x1111);
    rf.poke(RegFile::RP_AF, 0x2222, true);

    rf.exAf();
    EXPECT_EQ(rf.read16(RegFile::RP_AF), 0x2222);
    EXPECT_EQ(rf.peek(RegFile::RP_AF, true), 0x1111);

    rf.exAf();
    EXPECT_EQ(rf.read16(RegFile::RP_AF), 0x1111);
}


TEST(RegFileTest, ExxSwapsThreePairs)
{
    RegFile rf;
    rf.poke(RegFile::RP_BC, 0x0001);
    rf.poke(RegFile::RP_DE, 0x0002);
    rf.poke(RegFile::RP_HL, 0x0003);
    rf.poke(RegFile::RP_BC, 0x1001, true);
    rf.poke(RegFile::RP_DE, 0x1002, true);
    rf.poke(RegFile::RP_HL, 0x1003, true);
    rf.poke(RegFile::RP_AF, 0x4444);

    rf.exx();
    EXPECT_EQ(rf.read16(RegFile::RP_BC), 0x1001);
    EXPECT_EQ(rf.read16(RegFile::RP_DE), 0x1002);
    EXPECT_EQ(rf.read16(RegFile::RP_HL), 0x1003);
    EXPECT_EQ(rf.peek(RegFile::RP_HL, true), 0x0003);
    EXPECT_EQ(rf.read16(RegFile::RP_AF), 0x4444);
}


TEST(RegFileTest, ExDeHlFollowsTheBank)
{
    RegFile rf;
    rf.poke(RegFile::RP_DE, 0x00DE);
    rf.poke(RegFile::RP_HL, 0x0011);
    rf.poke(RegFile::RP_DE, 0x10DE, true);
    rf.poke(RegFile::RP_HL, 0x1011, true);

    rf.exDeHl();
    EXPECT_EQ(rf.read16(RegFile::RP_DE), 0x0011);
    EXPECT_EQ(rf.read16(RegFile::RP_HL), 0x00DE);

    // the other bank is untouched
    rf.exx();
    EXPECT_EQ(rf.read16(RegFile::RP_DE), 0x10DE);
    EXPECT_EQ(rf.read16(RegFile::RP_HL), 0x1011);

    rf.exx();
    rf.beginPhase();
    rf.write8(RegFile::R8_H, 0xAB);
    EXPECT_EQ(rf.read16(RegFile::RP_HL), 0xABDE);
    EXPECT_EQ(rf.read16(RegFile::RP_DE), 0x0011);

    rf.resetBanks();
    EXPECT_EQ(rf.read16(RegFile::RP_DE), 0xABDE);
}

// vim: ts=8:et:sw=4:smarttab
