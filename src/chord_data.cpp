#include "chord_table.hpp"

/*
 * Embedded chord dataset, standard G C E A tuning.
 * Strings listed G C E A; second pattern (when present) is a closed shape up the neck.
 * Flat/sharp spellings not listed here are added as aliases by ChordTable.
 */
static const std::vector<ChordEntry> kChords = {
  {"C",       {"0 0 0 3", "5 4 3 3"}},
  {"Cm",      {"0 3 3 3", "5 3 3 3"}},
  {"C7",      {"0 0 0 1", "3 4 3 3"}},
  {"Cm7",     {"3 3 3 3", "5 7 6 6"}},
  {"Cmaj7",   {"0 0 0 2", "4 4 3 3"}},
  {"C6",      {"0 0 0 0", "2 4 3 3"}},
  {"Cm6",     {"2 3 3 3", "5 7 5 6"}},
  {"C9",      {"3 2 0 3", "5 4 6 5"}},
  {"Cadd9",   {"0 2 0 3", "5 4 3 5"}},
  {"Csus2",   {"0 2 3 3", "5 2 3 3"}},
  {"Csus4",   {"0 0 1 3", "5 5 3 3"}},
  {"C7sus4",  {"0 0 1 1", "3 5 3 3"}},
  {"Cdim",    {"5 3 2 3", "5 6 8 6"}},
  {"Cdim7",   {"2 3 2 3", "5 6 5 6"}},
  {"Cm7b5",   {"3 3 2 3", "5 6 6 6"}},
  {"Caug",    {"1 0 0 3", "1 4 4 3"}},
  {"C#",      {"1 1 1 4", "6 5 4 4"}},
  {"C#m",     {"1 1 0 4", "1 4 4 4"}},
  {"C#7",     {"1 1 1 2", "4 5 4 4"}},
  {"C#m7",    {"1 1 0 2", "4 4 4 4"}},
  {"C#maj7",  {"1 1 1 3", "5 5 4 4"}},
  {"C#6",     {"1 1 1 1", "3 5 4 4"}},
  {"C#m6",    {"1 1 0 1", "3 4 4 4"}},
  {"C#9",     {"4 3 1 4", "6 5 7 6"}},
  {"C#add9",  {"1 3 1 4", "6 5 4 6"}},
  {"C#sus2",  {"1 3 4 4", "6 3 4 4"}},
  {"C#sus4",  {"1 1 2 4", "6 6 4 4"}},
  {"C#7sus4", {"1 1 2 2", "4 6 4 4"}},
  {"C#dim",   {"0 1 0 4", "6 4 3 4"}},
  {"C#dim7",  {"0 1 0 1", "3 4 3 4"}},
  {"C#m7b5",  {"0 1 0 2", "4 4 3 4"}},
  {"C#aug",   {"2 1 1 0", "2 1 1 4"}},
  {"D",       {"2 2 2 0", "2 2 2 5"}},
  {"Dm",      {"2 2 1 0", "2 5 5 5"}},
  {"D7",      {"2 2 2 3", "5 6 5 5"}},
  {"Dm7",     {"2 2 1 3", "5 5 5 5"}},
  {"Dmaj7",   {"2 2 2 4", "6 6 5 5"}},
  {"D6",      {"2 2 2 2", "4 6 5 5"}},
  {"Dm6",     {"2 2 1 2", "4 5 5 5"}},
  {"D9",      {"5 4 2 5", "7 6 8 7"}},
  {"Dadd9",   {"2 4 2 5", "7 6 5 7"}},
  {"Dsus2",   {"2 2 0 0", "2 4 5 5"}},
  {"Dsus4",   {"0 2 3 0", "2 2 3 5"}},
  {"D7sus4",  {"2 2 3 3", "5 7 5 5"}},
  {"Ddim",    {"7 5 4 5"}},
  {"Ddim7",   {"1 2 1 2", "4 5 4 5"}},
  {"Dm7b5",   {"1 2 1 3", "5 5 4 5"}},
  {"Daug",    {"3 2 2 1", "3 2 2 5"}},
  {"Eb",      {"0 3 3 1", "3 3 3 1"}},
  {"Ebm",     {"3 3 2 1", "3 6 6 6"}},
  {"Eb7",     {"3 3 3 4", "6 7 6 6"}},
  {"Ebm7",    {"3 3 2 4", "6 6 6 6"}},
  {"Ebmaj7",  {"3 3 3 5", "7 7 6 6"}},
  {"Eb6",     {"3 3 3 3", "5 7 6 6"}},
  {"Ebm6",    {"3 3 2 3", "5 6 6 6"}},
  {"Eb9",     {"0 3 1 4", "6 5 3 6"}},
  {"Ebadd9",  {"0 3 1 1", "3 5 3 6"}},
  {"Ebsus2",  {"3 3 1 1", "3 5 6 6"}},
  {"Ebsus4",  {"1 3 4 1", "3 3 4 1"}},
  {"Eb7sus4", {"3 3 4 4", "6 8 6 6"}},
  {"Ebdim",   {"2 3 2 0", "8 6 5 6"}},
  {"Ebdim7",  {"2 3 2 3", "5 6 5 6"}},
  {"Ebm7b5",  {"2 3 2 4", "6 6 5 6"}},
  {"Ebaug",   {"0 3 3 2", "4 3 3 2"}},
  {"E",       {"1 4 0 2", "1 4 4 2"}},
  {"Em",      {"0 4 0 2", "4 4 3 2"}},
  {"E7",      {"1 2 0 2", "4 4 4 5"}},
  {"Em7",     {"0 2 0 2", "4 4 3 5"}},
  {"Emaj7",   {"1 3 0 2", "4 4 4 6"}},
  {"E6",      {"1 1 0 2", "4 4 4 4"}},
  {"Em6",     {"0 1 0 2", "4 4 3 4"}},
  {"E9",      {"7 6 4 7"}},
  {"Eadd9",   {"1 4 2 2", "4 6 4 7"}},
  {"Esus2",   {"4 4 2 2", "4 6 7 7"}},
  {"Esus4",   {"2 4 0 2", "2 4 5 2"}},
  {"E7sus4",  {"2 2 0 2", "4 4 5 5"}},
  {"Edim",    {"0 4 0 1", "3 4 3 1"}},
  {"Edim7",   {"0 1 0 1", "3 4 3 4"}},
  {"Em7b5",   {"0 2 0 1", "3 4 3 5"}},
  {"Eaug",    {"1 0 0 3", "1 4 4 3"}},
  {"F",       {"2 0 1 0", "2 5 5 3"}},
  {"Fm",      {"1 0 1 3", "5 5 4 3"}},
  {"F7",      {"2 3 1 3", "5 5 5 6"}},
  {"Fm7",     {"1 3 1 3", "5 5 4 6"}},
  {"Fmaj7",   {"2 4 1 3", "5 5 5 7"}},
  {"F6",      {"2 2 1 3", "5 5 5 5"}},
  {"Fm6",     {"1 2 1 3", "5 5 4 5"}},
  {"F9",      {"0 3 1 0", "8 7 5 8"}},
  {"Fadd9",   {"0 0 1 0", "2 5 3 3"}},
  {"Fsus2",   {"0 0 1 3", "5 5 3 3"}},
  {"Fsus4",   {"3 0 1 1", "3 5 6 3"}},
  {"F7sus4",  {"3 3 1 3", "5 5 6 6"}},
  {"Fdim",    {"4 5 4 2"}},
  {"Fdim7",   {"1 2 1 2", "4 5 4 5"}},
  {"Fm7b5",   {"1 3 1 2", "4 5 4 6"}},
  {"Faug",    {"2 1 1 0", "2 1 1 4"}},
  {"F#",      {"3 1 2 1", "3 1 2 4"}},
  {"F#m",     {"2 1 2 0", "2 1 2 4"}},
  {"F#7",     {"3 4 2 4", "6 6 6 7"}},
  {"F#m7",    {"2 4 2 4", "6 6 5 7"}},
  {"F#maj7",  {"3 5 2 4", "6 6 6 8"}},
  {"F#6",     {"3 3 2 4", "6 6 6 6"}},
  {"F#m6",    {"2 3 2 4", "6 6 5 6"}},
  {"F#9",     {"1 4 2 1", "9 8 6 9"}},
  {"F#add9",  {"1 1 2 1", "3 6 4 4"}},
  {"F#sus2",  {"1 1 2 4", "6 6 4 4"}},
  {"F#sus4",  {"4 1 2 2", "4 1 2 4"}},
  {"F#7sus4", {"4 4 2 4", "6 6 7 7"}},
  {"F#dim",   {"2 0 2 0", "5 6 5 3"}},
  {"F#dim7",  {"2 3 2 3", "5 6 5 6"}},
  {"F#m7b5",  {"2 4 2 3", "5 6 5 7"}},
  {"F#aug",   {"3 2 2 1", "3 2 2 5"}},
  {"G",       {"0 2 3 2", "4 2 3 2"}},
  {"Gm",      {"0 2 3 1", "3 2 3 1"}},
  {"G7",      {"0 2 1 2", "4 5 3 5"}},
  {"Gm7",     {"0 2 1 1", "3 5 3 5"}},
  {"Gmaj7",   {"0 2 2 2", "4 6 3 5"}},
  {"G6",      {"0 2 0 2", "4 4 3 5"}},
  {"Gm6",     {"0 2 0 1", "3 4 3 5"}},
  {"G9",      {"0 5 5 2", "2 5 3 2"}},
  {"Gadd9",   {"2 2 3 2", "4 7 5 5"}},
  {"Gsus2",   {"0 2 3 0", "2 2 3 5"}},
  {"Gsus4",   {"0 2 3 3", "5 2 3 3"}},
  {"G7sus4",  {"0 2 1 3", "5 5 3 5"}},
  {"Gdim",    {"0 1 3 1", "3 1 3 1"}},
  {"Gdim7",   {"0 1 0 1", "3 4 3 4"}},
  {"Gm7b5",   {"0 1 1 1", "3 5 3 4"}},
  {"Gaug",    {"0 3 3 2", "4 3 3 2"}},
  {"Ab",      {"1 3 4 3", "5 3 4 3"}},
  {"Abm",     {"1 3 4 2", "4 3 4 2"}},
  {"Ab7",     {"1 3 2 3", "5 6 4 6"}},
  {"Abm7",    {"1 3 2 2", "4 6 4 6"}},
  {"Abmaj7",  {"1 3 3 3", "5 7 4 6"}},
  {"Ab6",     {"1 3 1 3", "5 5 4 6"}},
  {"Abm6",    {"1 3 1 2", "4 5 4 6"}},
  {"Ab9",     {"1 0 2 1", "3 6 4 3"}},
  {"Abadd9",  {"3 3 4 3", "5 8 6 6"}},
  {"Absus2",  {"1 3 4 1", "3 3 4 1"}},
  {"Absus4",  {"1 3 4 4", "6 3 4 4"}},
  {"Ab7sus4", {"1 3 2 4", "6 6 4 6"}},
  {"Abdim",   {"1 2 4 2", "4 2 4 2"}},
  {"Abdim7",  {"1 2 1 2", "4 5 4 5"}},
  {"Abm7b5",  {"1 2 2 2", "4 6 4 5"}},
  {"Abaug",   {"1 0 0 3", "1 4 4 3"}},
  {"A",       {"2 1 0 0", "2 4 5 4"}},
  {"Am",      {"2 0 0 0", "2 4 5 3"}},
  {"A7",      {"0 1 0 0", "2 4 3 4"}},
  {"Am7",     {"0 0 0 0", "2 4 3 3"}},
  {"Amaj7",   {"1 1 0 0", "2 4 4 4"}},
  {"A6",      {"2 4 2 4", "6 6 5 7"}},
  {"Am6",     {"2 4 2 3", "5 6 5 7"}},
  {"A9",      {"2 1 3 2", "4 7 5 4"}},
  {"Aadd9",   {"2 1 0 2", "4 4 5 4"}},
  {"Asus2",   {"2 4 0 2", "2 4 5 2"}},
  {"Asus4",   {"2 2 0 0", "2 4 5 5"}},
  {"A7sus4",  {"0 2 0 0", "2 4 3 5"}},
  {"Adim",    {"2 3 5 3", "5 3 5 3"}},
  {"Adim7",   {"2 3 2 3", "5 6 5 6"}},
  {"Am7b5",   {"2 3 3 3", "5 7 5 6"}},
  {"Aaug",    {"2 1 1 0", "2 1 1 4"}},
  {"Bb",      {"3 2 1 1", "3 5 6 5"}},
  {"Bbm",     {"3 1 1 1", "3 1 1 4"}},
  {"Bb7",     {"1 2 1 1", "3 5 4 5"}},
  {"Bbm7",    {"1 1 1 1", "3 5 4 4"}},
  {"Bbmaj7",  {"2 2 1 1", "3 5 5 5"}},
  {"Bb6",     {"0 2 1 1", "3 5 3 5"}},
  {"Bbm6",    {"0 1 1 1", "3 5 3 4"}},
  {"Bb9",     {"3 2 4 3", "5 8 6 5"}},
  {"Bbadd9",  {"3 2 1 3", "5 5 6 5"}},
  {"Bbsus2",  {"3 0 1 1", "3 5 6 3"}},
  {"Bbsus4",  {"3 3 1 1", "3 5 6 6"}},
  {"Bb7sus4", {"1 3 1 1", "3 5 4 6"}},
  {"Bbdim",   {"3 1 0 1", "3 4 6 4"}},
  {"Bbdim7",  {"0 1 0 1", "3 4 3 4"}},
  {"Bbm7b5",  {"1 1 0 1", "3 4 4 4"}},
  {"Bbaug",   {"3 2 2 1", "3 2 2 5"}},
  {"B",       {"4 3 2 2", "4 6 7 6"}},
  {"Bm",      {"4 2 2 2", "4 2 2 5"}},
  {"B7",      {"2 3 2 2", "4 6 5 6"}},
  {"Bm7",     {"2 2 2 2", "4 6 5 5"}},
  {"Bmaj7",   {"3 3 2 2", "4 6 6 6"}},
  {"B6",      {"1 3 2 2", "4 6 4 6"}},
  {"Bm6",     {"1 2 2 2", "4 6 4 5"}},
  {"B9",      {"4 3 5 4", "6 9 7 6"}},
  {"Badd9",   {"4 3 2 4", "6 6 7 6"}},
  {"Bsus2",   {"4 1 2 2", "4 1 2 4"}},
  {"Bsus4",   {"4 4 2 2", "4 6 7 7"}},
  {"B7sus4",  {"2 4 2 2", "4 6 5 7"}},
  {"Bdim",    {"4 2 1 2", "4 5 7 5"}},
  {"Bdim7",   {"1 2 1 2", "4 5 4 5"}},
  {"Bm7b5",   {"2 2 1 2", "4 5 5 5"}},
  {"Baug",    {"0 3 3 2", "4 3 3 2"}},

  // extended and altered qualities, not every root has a closed shape
  {"Cmaj9",    {"4 2 0 3", "5 4 7 5"}},
  {"Cm9",      {"5 3 6 5"}},
  {"Cmadd9",   {"5 3 3 5", "7 7 8 6"}},
  {"C7sus2",   {"3 2 3 3", "5 7 6 5"}},
  {"C7+5",     {"1 0 0 1", "3 4 4 3"}},
  {"C7b5",     {"3 4 2 3", "5 6 6 7"}},
  {"CmM7",     {"4 3 3 3", "5 7 7 6"}},
  {"C6/9",     {"2 2 0 3", "5 4 5 5"}},
  {"Cadd11",   {"0 4 1 3", "9 7 8 8"}},
  {"Cmadd11",  {"0 3 1 3", "5 5 3 6"}},
  {"C#maj9",   {"6 5 8 6"}},
  {"C#m9",     {"4 3 0 4", "6 4 7 6"}},
  {"C#madd9",  {"1 3 0 4", "6 4 4 6"}},
  {"C#7sus2",  {"4 3 4 4", "6 8 7 6"}},
  {"C#7+5",    {"2 1 1 2", "4 5 5 4"}},
  {"C#7b5",    {"0 1 1 2", "4 5 3 4"}},
  {"C#mM7",    {"1 1 0 3", "5 4 4 4"}},
  {"C#6/9",    {"3 3 1 4", "6 5 6 6"}},
  {"C#add11",  {"10 8 9 9"}},
  {"C#madd11", {"1 4 2 4", "6 6 4 7"}},
  {"Dmaj9",    {"6 6 0 5", "7 6 9 7"}},
  {"Dm9",      {"5 5 0 5"}},
  {"Dmadd9",   {"2 5 0 5", "7 5 5 7"}},
  {"D7sus2",   {"2 2 0 3", "5 4 5 5"}},
  {"D7+5",     {"3 2 2 3", "5 6 6 5"}},
  {"D7b5",     {"1 2 2 3", "5 6 4 5"}},
  {"DmM7",     {"2 2 1 4", "6 5 5 5"}},
  {"D6/9",     {"4 4 2 5", "7 6 7 7"}},
  {"Dadd11",   {"0 2 2 0"}},
  {"Dmadd11",  {"0 2 1 0", "2 5 3 5"}},
  {"Ebmaj9",   {"8 7 10 8"}},
  {"Ebm9",     {"8 6 9 8"}},
  {"Ebmadd9",  {"8 6 6 8"}},
  {"Eb7sus2",  {"3 3 1 4", "6 5 6 6"}},
  {"Eb7+5",    {"4 3 3 4", "6 7 7 6"}},
  {"Eb7b5",    {"2 3 3 4", "6 7 5 6"}},
  {"EbmM7",    {"3 3 2 5", "7 6 6 6"}},
  {"Eb6/9",    {"0 3 1 3", "5 5 3 6"}},
  {"Ebadd11",  {"1 3 3 1"}},
  {"Ebmadd11", {"1 3 2 1", "3 6 4 6"}},
  {"Emaj9",    {"8 8 0 9"}},
  {"Em9",      {"0 4 2 5", "9 7 10 9"}},
  {"Emadd9",   {"0 4 2 2", "9 7 7 9"}},
  {"E7sus2",   {"4 4 2 5", "7 6 7 7"}},
  {"E7+5",     {"1 2 0 3", "5 4 4 5"}},
  {"E7b5",     {"1 2 0 1", "3 4 4 5"}},
  {"EmM7",     {"0 3 0 2", "4 4 3 6"}},
  {"E6/9",     {"1 4 2 4", "6 6 4 7"}},
  {"Eadd11",   {"2 4 4 2"}},
  {"Emadd11",  {"2 4 3 2", "4 7 5 7"}},
  {"Fmaj9",    {"0 4 1 0"}},
  {"Fm9",      {"0 5 4 6"}},
  {"Fmadd9",   {"0 5 4 3", "10 8 8 10"}},
  {"F7sus2",   {"0 3 1 3", "5 5 3 6"}},
  {"F7+5",     {"2 3 1 4", "6 5 5 6"}},
  {"F7b5",     {"2 3 1 2", "4 5 5 6"}},
  {"FmM7",     {"1 4 1 3", "5 5 4 7"}},
  {"F6/9",     {"0 2 1 0", "2 5 3 5"}},
  {"Fadd11",   {"2 0 1 1", "3 5 5 3"}},
  {"Fmadd11",  {"1 0 1 1", "3 5 4 3"}},
  {"F#maj9",   {"1 5 2 1", "10 8 6 9"}},
  {"F#m9",     {"1 4 2 0"}},
  {"F#madd9",  {"1 1 2 0"}},
  {"F#7sus2",  {"1 4 2 4", "6 6 4 7"}},
  {"F#7+5",    {"3 4 2 5", "7 6 6 7"}},
  {"F#7b5",    {"3 4 2 3", "5 6 6 7"}},
  {"F#mM7",    {"2 5 2 4", "6 6 5 8"}},
  {"F#6/9",    {"1 3 2 1", "3 6 4 6"}},
  {"F#add11",  {"3 1 2 2", "4 6 6 4"}},
  {"F#madd11", {"2 1 2 2", "4 6 5 4"}},
  {"Gmaj9",    {"4 6 3 0"}},
  {"Gm9",      {"3 5 3 0"}},
  {"Gmadd9",   {"2 2 3 1"}},
  {"G7sus2",   {"0 2 1 0", "2 5 3 5"}},
  {"G7+5",     {"0 3 1 2", "4 5 3 6"}},
  {"G7b5",     {"0 1 1 2", "4 5 3 4"}},
  {"GmM7",     {"0 2 2 1", "3 6 3 5"}},
  {"G6/9",     {"2 4 3 2", "4 7 5 7"}},
  {"Gadd11",   {"4 2 3 3", "5 7 7 5"}},
  {"Gmadd11",  {"3 2 3 3", "5 7 6 5"}},
  {"Abmaj9",   {"1 0 3 1"}},
  {"Abm9",     {"3 6 4 2"}},
  {"Abmadd9",  {"3 3 4 2"}},
  {"Ab7sus2",  {"1 3 2 1", "3 6 4 6"}},
  {"Ab7+5",    {"1 4 2 3", "5 6 4 7"}},
  {"Ab7b5",    {"1 2 2 3", "5 6 4 5"}},
  {"AbmM7",    {"1 3 3 2", "4 7 4 6"}},
  {"Ab6/9",    {"1 0 1 1", "3 5 4 3"}},
  {"Abadd11",  {"5 3 4 4", "6 8 8 6"}},
  {"Abmadd11", {"4 3 4 4", "6 8 7 6"}},
  {"Amaj9",    {"2 1 4 2"}},
  {"Am9",      {"2 0 3 2"}},
  {"Amadd9",   {"2 0 0 2", "4 4 5 3"}},
  {"A7sus2",   {"2 4 3 2", "4 7 5 7"}},
  {"A7+5",     {"0 1 1 0", "2 5 3 4"}},
  {"A7b5",     {"2 3 3 4", "6 7 5 6"}},
  {"AmM7",     {"1 0 0 0", "2 4 4 3"}},
  {"A6/9",     {"2 1 2 2", "4 6 5 4"}},
  {"Aadd11",   {"2 2 0 4", "6 4 5 5"}},
  {"Amadd11",  {"2 2 0 3", "5 4 5 5"}},
  {"Bbmaj9",   {"3 0 5 5"}},
  {"Bbm9",     {"3 0 4 4"}},
  {"Bbmadd9",  {"3 1 1 3", "5 5 6 4"}},
  {"Bb7sus2",  {"1 0 1 1", "3 5 4 3"}},
  {"Bb7+5",    {"1 2 2 1", "3 6 4 5"}},
  {"Bb7b5",    {"1 2 0 1", "3 4 4 5"}},
  {"BbmM7",    {"2 1 1 1", "3 5 5 4"}},
  {"Bb6/9",    {"3 2 3 3", "5 7 6 5"}},
  {"Bbadd11",  {"7 5 6 6", "8 10 10 8"}},
  {"Bbmadd11", {"3 3 1 4", "6 5 6 6"}},
  {"Bmaj9",    {"4 3 6 4"}},
  {"Bm9",      {"4 2 5 4"}},
  {"Bmadd9",   {"4 2 2 4", "6 6 7 5"}},
  {"B7sus2",   {"2 1 2 2", "4 6 5 4"}},
  {"B7+5",     {"2 3 3 2", "4 7 5 6"}},
  {"B7b5",     {"2 3 1 2", "4 5 5 6"}},
  {"BmM7",     {"3 2 2 2", "4 6 6 5"}},
  {"B6/9",     {"4 3 4 4", "6 8 7 6"}},
  {"Badd11",   {"4 6 0 6", "8 6 7 7"}},
  {"Bmadd11",  {"4 4 2 5", "7 6 7 7"}},
};

const std::vector<ChordEntry>& embedded_chords() { return kChords; }
